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
#ifndef ENVIRONMENT_H
#define ENVIRONMENT_H

#include <pthread.h>
#include <string>

#include "connection.h"

#define READ_CHUNK_LEN  1024

class ConnectionGuard;

//
// Environment
//
// where the shell reads commands from and writes answers to. Normally the
// local terminal; while a peer is attached both directions go through the
// peer's socket. The *_local calls always reach the terminal.
//
class Environment
{
    friend class ConnectionGuard;

 private:
    int local_in;
    int local_out;
    int in_fd;
    int out_fd;

    std::string cwd;
    std::string line_buf;
    std::string saved_line_buf;
    int input_closed;

    pthread_mutex_t write_lock;

    int attach(int in, int out, Crypto* enc, Crypto* dec);
    void detach();

    Environment(const Environment&);
    Environment& operator=(const Environment&);

 public:
    Connection connection;

    Environment(int local_in, int local_out);
    ~Environment();

    // 1 with a line (without its newline), 0 at end of input, -1 on error
    int readln(std::string& line);

    // 1 once input is ready to read, 0 when wake_fd became readable first,
    // -1 on error
    int wait_input(int wake_fd);

    int write(const char* data, int len);
    int writeln(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    int write_local(const char* data, int len);
    int writeln_local(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    const std::string& get_cwd() const { return cwd; }
    int set_cwd(const std::string& path);

    int is_attached() const { return connection.is_connected(); }
};

//
// ConnectionGuard
//
// attaching a peer is acquiring the guard, its destructor is the only way
// to detach. A second guard on an attached environment is not acquired
// and changes nothing.
//
class ConnectionGuard
{
 private:
    Environment* env;
    int is_acquired;

    ConnectionGuard(const ConnectionGuard&);
    ConnectionGuard& operator=(const ConnectionGuard&);

 public:
    ConnectionGuard(Environment* env, int in, int out, Crypto* enc, Crypto* dec);
    ~ConnectionGuard();

    int acquired() const { return is_acquired; }
};

#endif // ENVIRONMENT_H
