/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the state of one remote session

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing,
software distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions
and limitations under the License.
*****************************************************************************/
#include "connection.h"
#include "util.h"
#include "debug_output.h"

Connection::Connection()
{
    in_fd = -1;
    out_fd = -1;
    encrypto = NULL;
    decrypto = NULL;
    connected = 0;
    bytes_sent = 0;
    bytes_received = 0;
    pthread_mutex_init(&transfer_lock, NULL);
    state_init(&send_state);
}

Connection::~Connection()
{
    state_destroy(&send_state);
    pthread_mutex_destroy(&transfer_lock);
}

void Connection::connect_streams(int in, int out, Crypto* enc, Crypto* dec)
{
    verb(VERB_2, "[%s] in = %d, out = %d", __func__, in, out);
    in_fd = in;
    out_fd = out;
    encrypto = enc;
    decrypto = dec;
    bytes_sent = 0;
    bytes_received = 0;
    pending_input.clear();
    set_state(&send_state, XFER_STATE_IDLE);
    connected = 1;
}

void Connection::disconnect_streams()
{
    verb(VERB_2, "[%s] sent %lld, received %lld", __func__, (long long)bytes_sent, (long long)bytes_received);
    in_fd = -1;
    out_fd = -1;
    encrypto = NULL;
    decrypto = NULL;
    pending_input.clear();
    connected = 0;
}

int Connection::get_mark(int id, std::string& path) const
{
    marks_t::const_iterator mark = marks.find(id);
    if ( mark == marks.end() ) {
        return RET_FAILURE;
    }
    path = mark->second;
    return RET_SUCCESS;
}

void Connection::unread(const char* data, int len)
{
    if ( len > 0 ) {
        verb(VERB_3, "[%s] holding %d bytes of input", __func__, len);
        pending_input.append(data, len);
    }
}

int Connection::take_pending(std::string& data)
{
    int len = pending_input.size();
    data.append(pending_input);
    pending_input.clear();
    return len;
}
