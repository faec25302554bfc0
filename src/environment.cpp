/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the shell's input and output

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
#include <poll.h>
#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>

#include "environment.h"
#include "network.h"
#include "util.h"
#include "debug_output.h"

#define MAX_LINE_LEN    4096

Environment::Environment(int local_in, int local_out)
{
    char path[MAX_PATH_LEN];

    this->local_in = local_in;
    this->local_out = local_out;
    in_fd = local_in;
    out_fd = local_out;
    input_closed = 0;
    pthread_mutex_init(&write_lock, NULL);

    if ( getcwd(path, sizeof(path)) ) {
        cwd = path;
    } else {
        cwd = "/";
    }
}

Environment::~Environment()
{
    pthread_mutex_destroy(&write_lock);
}

int Environment::attach(int in, int out, Crypto* enc, Crypto* dec)
{
    if ( connection.is_connected() ) {
        verb(VERB_2, "[%s] a connection is already attached", __func__);
        return RET_FAILURE;
    }

    pthread_mutex_lock(&write_lock);
    connection.connect_streams(in, out, enc, dec);
    in_fd = in;
    out_fd = out;
    saved_line_buf.swap(line_buf);
    line_buf.clear();
    pthread_mutex_unlock(&write_lock);

    return RET_SUCCESS;
}

void Environment::detach()
{
    pthread_mutex_lock(&write_lock);
    connection.disconnect_streams();
    in_fd = local_in;
    out_fd = local_out;
    line_buf.swap(saved_line_buf);
    saved_line_buf.clear();
    pthread_mutex_unlock(&write_lock);
}

int Environment::readln(std::string& line)
{
    char buf[READ_CHUNK_LEN];
    int closed = connection.is_connected() ? 0 : input_closed;

    line.clear();

    while ( 1 ) {
        if ( connection.is_connected() ) {
            connection.take_pending(line_buf);
        }

        size_t newline = line_buf.find('\n');
        if ( newline != std::string::npos ) {
            line.assign(line_buf, 0, newline);
            line_buf.erase(0, newline + 1);
            break;
        }

        if ( line_buf.size() > MAX_LINE_LEN ) {
            verb(VERB_2, "[%s] line longer than %d bytes, splitting", __func__, MAX_LINE_LEN);
            line.assign(line_buf, 0, MAX_LINE_LEN);
            line_buf.erase(0, MAX_LINE_LEN);
            break;
        }

        ssize_t rs = closed ? 0 : stream_read(in_fd, buf, sizeof(buf));
        if ( rs < 0 ) {
            return -1;
        }
        if ( rs == 0 ) {
            if ( !connection.is_connected() ) {
                input_closed = 1;
            }
            if ( line_buf.empty() ) {
                return 0;
            }
            // last line without a newline
            line.swap(line_buf);
            line_buf.clear();
            break;
        }
        line_buf.append(buf, rs);
    }

    if ( !line.empty() && line[line.size() - 1] == '\r' ) {
        line.erase(line.size() - 1);
    }
    return 1;
}

int Environment::wait_input(int wake_fd)
{
    struct pollfd fds[2];

    if ( line_buf.find('\n') != std::string::npos || input_closed ) {
        return 1;
    }

    fds[0].fd = in_fd;
    fds[0].events = POLLIN;
    fds[1].fd = wake_fd;
    fds[1].events = POLLIN;

    while ( 1 ) {
        int ret = poll(fds, wake_fd >= 0 ? 2 : 1, -1);
        if ( ret < 0 ) {
            if ( errno == EINTR ) {
                continue;
            }
            verb(VERB_2, "[%s] poll failed: %s", __func__, strerror(errno));
            return -1;
        }
        if ( wake_fd >= 0 && fds[1].revents ) {
            return 0;
        }
        if ( fds[0].revents ) {
            return 1;
        }
    }
}

int Environment::write(const char* data, int len)
{
    pthread_mutex_lock(&write_lock);
    ssize_t ws = stream_write_fully(out_fd, data, len);
    pthread_mutex_unlock(&write_lock);

    return ws < 0 ? RET_FAILURE : RET_SUCCESS;
}

int Environment::writeln(const char* fmt, ...)
{
    char* text = NULL;
    va_list args;

    va_start(args, fmt);
    int len = vasprintf(&text, fmt, args);
    va_end(args);
    if ( len < 0 ) {
        return RET_FAILURE;
    }

    std::string line(text, len);
    free(text);
    line += "\n";

    return write(line.data(), line.size());
}

int Environment::write_local(const char* data, int len)
{
    pthread_mutex_lock(&write_lock);
    ssize_t ws = stream_write_fully(local_out, data, len);
    pthread_mutex_unlock(&write_lock);

    return ws < 0 ? RET_FAILURE : RET_SUCCESS;
}

int Environment::writeln_local(const char* fmt, ...)
{
    char* text = NULL;
    va_list args;

    va_start(args, fmt);
    int len = vasprintf(&text, fmt, args);
    va_end(args);
    if ( len < 0 ) {
        return RET_FAILURE;
    }

    std::string line(text, len);
    free(text);
    line += "\n";

    return write_local(line.data(), line.size());
}

int Environment::set_cwd(const std::string& path)
{
    struct stat stats;

    if ( stat(path.c_str(), &stats) || !S_ISDIR(stats.st_mode) ) {
        return RET_FAILURE;
    }
    cwd = path;
    return RET_SUCCESS;
}


ConnectionGuard::ConnectionGuard(Environment* env, int in, int out, Crypto* enc, Crypto* dec)
{
    this->env = env;
    is_acquired = (env->attach(in, out, enc, dec) == RET_SUCCESS);
    if ( is_acquired ) {
        verb(VERB_2, "[%s] session streams attached", __func__);
    }
}

ConnectionGuard::~ConnectionGuard()
{
    if ( is_acquired ) {
        env->detach();
        verb(VERB_2, "[%s] session streams detached", __func__);
    }
}
