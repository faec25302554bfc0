/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the TCP plumbing of remote sessions

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
#ifndef NETWORK_H
#define NETWORK_H

#include <sys/types.h>
#include <string>

#define MAX_ADDR_LEN            64
#define PUBLIC_IP_HOST          "checkip.amazonaws.com"
#define PUBLIC_IP_TIMEOUT_SEC   3
#define UNKNOWN_ADDRESS         "unknown"

// returned by the stream helpers when the peer is gone
#define STREAM_CLOSED           0
#define STREAM_ERROR            -1

// binds every interface, port 0 lets the system pick; the chosen port is
// written to bound_port. Returns the listening fd or -1
int tcp_listen(int port, int* bound_port);

// blocks for one peer, peer_addr receives "ip:port". Returns the fd or -1
int tcp_accept(int listen_fd, char peer_addr[MAX_ADDR_LEN]);

// Returns the connected fd or -1
int tcp_connect(const char* host, int port);

// as tcp_connect, giving up on each address after timeout_sec
int tcp_connect_timed(const char* host, int port, int timeout_sec);

// "1 to 65535", 0 only when allow_zero
int parse_port(const char* str, int allow_zero, int* port);

std::string get_local_ip_address();

// best effort, UNKNOWN_ADDRESS when the lookup fails or times out
std::string get_public_ip_address();

// one read, retried on EINTR. Returns the count, STREAM_CLOSED or STREAM_ERROR
ssize_t stream_read(int fd, char* buf, size_t len);

// reads exactly len bytes or reports why it could not
ssize_t stream_read_fully(int fd, char* buf, size_t len);

// writes all of buf, sockets never raise SIGPIPE
ssize_t stream_write_fully(int fd, const char* buf, size_t len);

#endif // NETWORK_H
