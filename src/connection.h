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
#ifndef CONNECTION_H
#define CONNECTION_H

#include <pthread.h>
#include <sys/types.h>

#include <string>

#include "crypto.h"
#include "files.h"
#include "state.h"

//
// Connection
//
// the streams and ciphers of one remote session plus what the shell keeps
// between commands (download directory, marks of the last listing).
// The ciphers are owned by whoever set up the session.
//
class Connection
{
 private:
    int in_fd;
    int out_fd;
    Crypto* encrypto;
    Crypto* decrypto;
    int connected;

    std::string download_path;
    marks_t marks;

    // text that arrived while a protocol step waited for a signal
    std::string pending_input;

    off_t bytes_sent;
    off_t bytes_received;

    // keeps forwarded keystrokes out of a running transfer
    pthread_mutex_t transfer_lock;
    xfer_state_holder_t send_state;

    Connection(const Connection&);
    Connection& operator=(const Connection&);

 public:
    Connection();
    ~Connection();

    void connect_streams(int in, int out, Crypto* enc, Crypto* dec);
    void disconnect_streams();
    int is_connected() const { return connected; }

    int get_in_fd() const { return in_fd; }
    int get_out_fd() const { return out_fd; }
    Crypto* get_encrypto() { return encrypto; }
    Crypto* get_decrypto() { return decrypto; }

    void set_download_path(const std::string& path) { download_path = path; }
    const std::string& get_download_path() const { return download_path; }

    void set_marks(const marks_t& new_marks) { marks = new_marks; }
    const marks_t& get_marks() const { return marks; }
    int get_mark(int id, std::string& path) const;

    void unread(const char* data, int len);
    int take_pending(std::string& data);

    void add_sent(off_t n) { bytes_sent += n; }
    void add_received(off_t n) { bytes_received += n; }
    off_t get_bytes_sent() const { return bytes_sent; }
    off_t get_bytes_received() const { return bytes_received; }

    void lock_transfer() { pthread_mutex_lock(&transfer_lock); }
    void unlock_transfer() { pthread_mutex_unlock(&transfer_lock); }

    void set_send_state(xfer_state_t state) { set_state(&send_state, state); }
    xfer_state_t get_send_state() { return get_state(&send_state); }
};

#endif // CONNECTION_H
