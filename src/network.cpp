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
#include <ifaddrs.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <net/if.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <ctype.h>

#include "network.h"
#include "util.h"
#include "debug_output.h"

// VERB_4 dumps of the stream traffic
#define DUMP_LIMIT      256
#define DUMP_LINE_LEN   16

int tcp_listen(int port, int* bound_port)
{
    struct sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);
    int yes = 1;

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if ( fd < 0 ) {
        verb(VERB_1, "[%s] unable to create socket: %s", __func__, strerror(errno));
        return -1;
    }

    if ( setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) ) {
        verb(VERB_2, "[%s] SO_REUSEADDR not set: %s", __func__, strerror(errno));
    }

    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if ( bind(fd, (struct sockaddr*)&addr, sizeof(addr)) || listen(fd, 1) ) {
        verb(VERB_1, "Unable to listen on port %d: %s", port, strerror(errno));
        close(fd);
        return -1;
    }

    if ( getsockname(fd, (struct sockaddr*)&addr, &addr_len) ) {
        verb(VERB_1, "[%s] getsockname failed: %s", __func__, strerror(errno));
        close(fd);
        return -1;
    }

    if ( bound_port ) {
        *bound_port = ntohs(addr.sin_port);
    }

    verb(VERB_2, "[%s] listening on port %d", __func__, ntohs(addr.sin_port));
    return fd;
}

int tcp_accept(int listen_fd, char peer_addr[MAX_ADDR_LEN])
{
    struct sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);
    int fd;

    do {
        fd = accept(listen_fd, (struct sockaddr*)&addr, &addr_len);
    } while ( fd < 0 && errno == EINTR );

    if ( fd < 0 ) {
        verb(VERB_1, "[%s] accept failed: %s", __func__, strerror(errno));
        return -1;
    }

    char host[NI_MAXHOST], serv[NI_MAXSERV];
    if ( getnameinfo((struct sockaddr*)&addr, addr_len, host, sizeof(host), serv, sizeof(serv),
                     NI_NUMERICHOST | NI_NUMERICSERV) ) {
        snprintf(peer_addr, MAX_ADDR_LEN, "%s", UNKNOWN_ADDRESS);
    } else {
        snprintf(peer_addr, MAX_ADDR_LEN, "%s:%s", host, serv);
    }

    return fd;
}

// caller owns fd; blocking connect when timeout_sec is 0
static int connect_within(int fd, const struct sockaddr* addr, socklen_t addr_len, int timeout_sec)
{
    if ( timeout_sec <= 0 ) {
        return connect(fd, addr, addr_len);
    }

    int flags = fcntl(fd, F_GETFL, 0);
    if ( flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) ) {
        return -1;
    }

    int ret = connect(fd, addr, addr_len);
    if ( ret && errno == EINPROGRESS ) {
        struct pollfd pfd = { fd, POLLOUT, 0 };
        int err = 0;
        socklen_t err_len = sizeof(err);

        ret = poll(&pfd, 1, timeout_sec * 1000);
        if ( ret == 0 ) {
            errno = ETIMEDOUT;
            ret = -1;
        } else if ( ret > 0 ) {
            if ( getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &err_len) ) {
                ret = -1;
            } else if ( err ) {
                errno = err;
                ret = -1;
            } else {
                ret = 0;
            }
        }
    }

    if ( fcntl(fd, F_SETFL, flags) && ret == 0 ) {
        ret = -1;
    }
    return ret;
}

int tcp_connect_timed(const char* host, int port, int timeout_sec)
{
    struct addrinfo hints, *result, *rp;
    char port_str[16];
    int fd = -1;

    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    snprintf(port_str, sizeof(port_str), "%d", port);

    int status = getaddrinfo(host, port_str, &hints, &result);
    if ( status ) {
        verb(VERB_1, "Unable to resolve %s: %s", host, gai_strerror(status));
        return -1;
    }

    for ( rp = result; rp != NULL; rp = rp->ai_next ) {
        fd = socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if ( fd < 0 ) {
            continue;
        }
        if ( connect_within(fd, rp->ai_addr, rp->ai_addrlen, timeout_sec) == 0 ) {
            break;
        }
        verb(VERB_2, "[%s] connect failed: %s", __func__, strerror(errno));
        close(fd);
        fd = -1;
    }

    freeaddrinfo(result);
    return fd;
}

int tcp_connect(const char* host, int port)
{
    return tcp_connect_timed(host, port, 0);
}

int parse_port(const char* str, int allow_zero, int* port)
{
    long value = 0;

    if ( !str || !*str || strlen(str) > 5 ) {
        return RET_FAILURE;
    }
    for ( const char* c = str; *c; c++ ) {
        if ( !isdigit((unsigned char)*c) ) {
            return RET_FAILURE;
        }
        value = value * 10 + (*c - '0');
    }
    if ( value > 65535 || (value == 0 && !allow_zero) ) {
        return RET_FAILURE;
    }

    *port = (int)value;
    return RET_SUCCESS;
}

std::string get_local_ip_address()
{
    struct ifaddrs *ifaddr, *ifa;
    std::string address = UNKNOWN_ADDRESS;

    if ( getifaddrs(&ifaddr) ) {
        verb(VERB_2, "[%s] getifaddrs failed: %s", __func__, strerror(errno));
        return address;
    }

    // first IPv4 address of an interface that is up and not loopback
    for ( ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next ) {
        if ( !ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET ) {
            continue;
        }
        if ( (ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_UP) ) {
            continue;
        }
        char host[INET_ADDRSTRLEN];
        if ( inet_ntop(AF_INET, &((struct sockaddr_in*)ifa->ifa_addr)->sin_addr, host, sizeof(host)) ) {
            address = host;
            break;
        }
    }

    freeifaddrs(ifaddr);
    return address;
}

std::string get_public_ip_address()
{
    struct timeval timeout;
    char response[1024];
    ssize_t total = 0, rs;

    int fd = tcp_connect_timed(PUBLIC_IP_HOST, 80, PUBLIC_IP_TIMEOUT_SEC);
    if ( fd < 0 ) {
        return UNKNOWN_ADDRESS;
    }

    timeout.tv_sec = PUBLIC_IP_TIMEOUT_SEC;
    timeout.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

    const char* request = "GET / HTTP/1.0\r\nHost: " PUBLIC_IP_HOST "\r\nConnection: close\r\n\r\n";
    if ( stream_write_fully(fd, request, strlen(request)) <= 0 ) {
        close(fd);
        return UNKNOWN_ADDRESS;
    }

    while ( total < (ssize_t)sizeof(response) - 1 &&
            (rs = stream_read(fd, response + total, sizeof(response) - 1 - total)) > 0 ) {
        total += rs;
    }
    close(fd);
    response[total] = '\0';

    // the body follows the blank line, one address and a newline
    char* body = strstr(response, "\r\n\r\n");
    if ( strncmp(response, "HTTP/", 5) || !strstr(response, " 200 ") || !body ) {
        verb(VERB_2, "[%s] unexpected response from %s", __func__, PUBLIC_IP_HOST);
        return UNKNOWN_ADDRESS;
    }
    body += 4;

    std::string address;
    for ( char* c = body; *c && (isxdigit((unsigned char)*c) || *c == '.' || *c == ':'); c++ ) {
        address += *c;
    }

    return address.empty() ? UNKNOWN_ADDRESS : address;
}

ssize_t stream_read(int fd, char* buf, size_t len)
{
    ssize_t rs;

    do {
        rs = read(fd, buf, len);
    } while ( rs < 0 && errno == EINTR );

    if ( rs < 0 ) {
        verb(VERB_3, "[%s] read on %d failed: %s", __func__, fd, strerror(errno));
        return STREAM_ERROR;
    }

    verb(VERB_4, "[%s] Read %zd bytes from %d", __func__, rs, fd);
    print_bytes(buf, (int)MIN(rs, (ssize_t)DUMP_LIMIT), DUMP_LINE_LEN);
    return rs;
}

ssize_t stream_read_fully(int fd, char* buf, size_t len)
{
    size_t total = 0;

    while ( total < len ) {
        ssize_t rs = stream_read(fd, buf + total, len - total);
        if ( rs <= 0 ) {
            return rs;
        }
        total += rs;
    }

    return total;
}

ssize_t stream_write_fully(int fd, const char* buf, size_t len)
{
    size_t total = 0;
    int is_socket = 1;

    while ( total < len ) {
        ssize_t ws;
        if ( is_socket ) {
            ws = send(fd, buf + total, len - total, MSG_NOSIGNAL);
            if ( ws < 0 && errno == ENOTSOCK ) {
                is_socket = 0;
                continue;
            }
        } else {
            ws = write(fd, buf + total, len - total);
        }

        if ( ws < 0 ) {
            if ( errno == EINTR ) {
                continue;
            }
            verb(VERB_3, "[%s] write on %d failed: %s", __func__, fd, strerror(errno));
            return STREAM_ERROR;
        }
        total += ws;
    }

    verb(VERB_4, "[%s] Wrote %zu bytes to %d", __func__, total, fd);
    print_bytes(buf, (int)MIN(total, (size_t)DUMP_LIMIT), DUMP_LINE_LEN);
    return total;
}
