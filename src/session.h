/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the host and client sides of a remote session

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
#ifndef SESSION_H
#define SESSION_H

#include <pthread.h>
#include <string>

#include "connection.h"
#include "network.h"

class Environment;

typedef struct session_opts_t {
	std::string password;
	std::string download_path;
	int reverse;
} session_opts_t;

//
// client_session_t
//
// one CONNECT: the foreground forwards lines, the reader thread shows what
// the peer answers and takes part in transfers
//
typedef struct client_session_t {
	Environment*    env;
	Connection      conn;
	Crypto*         encrypto;
	Crypto*         decrypto;
	int             sock;
	int             wake_pipe[2];
	pthread_t       reader;
	volatile int    peer_gone;
	char            peer_addr[MAX_ADDR_LEN];
} client_session_t;

// derives the cipher pair of a session from password, RET_FAILURE leaves
// both NULL
int create_session_ciphers(const std::string& password, Crypto** enc, Crypto** dec);

// the peer drives env's shell until it leaves, sock is closed on return
int host_session(Environment* env, int sock, const char* peer_addr, const session_opts_t* opts);

// env's input goes to the peer until exit or end of input, sock is closed
// on return
int connect_session(Environment* env, int sock, const char* peer_addr, const session_opts_t* opts);

// reading thread of connect_session
void* client_reader(void* arg);

// prints the byte counters of a finished session
void print_session_stats(Environment* env, const Connection* conn, int timer);

#endif // SESSION_H
