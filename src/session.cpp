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

#include <ctype.h>
#include <errno.h>
#include <string.h>
#include <strings.h>
#include <unistd.h>
#include <sys/socket.h>

#include "session.h"
#include "environment.h"
#include "shell.h"
#include "transfer.h"
#include "hint.h"
#include "progress.h"
#include "thread_manager.h"
#include "timer.h"
#include "util.h"

#define WAKE_BYTE   'w'


int create_session_ciphers(const std::string& password, Crypto** enc, Crypto** dec)
{
	char hash[HASH_HEX_BUFFER_LEN];

	*enc = NULL;
	*dec = NULL;

	if ( generate_password_hash(password.c_str(), hash) ) {
		warn("unable to hash the session password");
		return RET_FAILURE;
	}

	*enc = Crypto::create(hash, EVP_ENCRYPT);
	*dec = Crypto::create(hash, EVP_DECRYPT);
	memset(hash, 0, sizeof(hash));

	if ( !*enc || !*dec ) {
		delete *enc;
		delete *dec;
		*enc = NULL;
		*dec = NULL;
		return RET_FAILURE;
	}

	return RET_SUCCESS;
}


/*
 * void print_session_stats
 * - prints the bytes moved through a session and how long it lasted
 */
void print_session_stats(Environment* env, const Connection* conn, int timer)
{
	char label[8];

	if ( timer < 0 ) {
		return;
	}

	stop_timer(timer);
	double elapsed = timer_elapsed(timer);
	off_t total = conn->get_bytes_sent() + conn->get_bytes_received();
	double scale = get_scale(total, label);

	verb(VERB_2, "STAT: %.2f %s transfered in %.2fs (%lld sent, %lld received)",
		total/scale, label, elapsed,
		(long long)conn->get_bytes_sent(), (long long)conn->get_bytes_received());
}


int host_session(Environment* env, int sock, const char* peer_addr, const session_opts_t* opts)
{
	Crypto* enc;
	Crypto* dec;
	int ret_val = RET_SUCCESS;

	if ( create_session_ciphers(opts->password, &enc, &dec) ) {
		env->writeln("Unable to set up encryption for %s.", peer_addr);
		close(sock);
		return RET_FAILURE;
	}

	init_debug_output_file(LOG_ROLE_HOST);
	env->writeln("%s connected.", peer_addr);

	int timer = new_timer("host session");
	if ( timer >= 0 ) {
		start_timer(timer);
	}

	{
		ConnectionGuard guard(env, sock, sock, enc, dec);

		if ( !guard.acquired() ) {
			env->writeln("A remote session is already attached.");
			ret_val = RET_FAILURE;
		} else {
			env->connection.set_download_path(opts->download_path);

			// the peer's commands run here until it types exit or leaves
			if ( run_shell(env) ) {
				verb(VERB_2, "[%s] session with %s ended on an I/O error", __func__, peer_addr);
			}
			print_session_stats(env, &env->connection, timer);
		}
	}

	shutdown(sock, SHUT_RDWR);
	close(sock);
	delete enc;
	delete dec;

	env->writeln("%s disconnected.", peer_addr);
	init_debug_output_file(LOG_ROLE_LOCAL);

	return ret_val;
}


//
// client_reader
//
// text from the host goes to the local terminal, markers switch the thread
// into the transfer protocol until the entry or request is done
//
void* client_reader(void* arg)
{
	client_session_t* session = (client_session_t*)arg;
	Environment* env = session->env;
	Connection* conn = &session->conn;
	HintScanner scanner;
	char buf[READ_CHUNK_LEN];
	std::string text;

	verb(VERB_2, "[%s] reading from %s", __func__, session->peer_addr);

	while ( !check_for_exit(THREAD_TYPE_READER) ) {
		ssize_t rs = stream_read(conn->get_in_fd(), buf, sizeof(buf));
		if ( rs <= 0 ) {
			verb(VERB_2, "[%s] stream ended (%zd)", __func__, rs);
			break;
		}

		text.clear();
		hint_t hint = scanner.scan(buf, rs, text);
		if ( !text.empty() ) {
			env->write_local(text.data(), text.size());
		}

		xfer_status_t status = XFER_OK;

		if ( hint == HINT_DOWNLOAD ) {
			conn->lock_transfer();
			status = receive_entry(conn, env, conn->get_download_path());
			conn->unlock_transfer();
		} else if ( hint == HINT_UPLOAD ) {
			conn->lock_transfer();
			status = serve_upload_request(conn, env);
			conn->unlock_transfer();
		} else if ( hint == HINT_END ) {
			verb(VERB_2, "[%s] end marker outside of a request", __func__);
		}

		if ( status == XFER_CONNECTION_ENDED ) {
			break;
		}
		if ( status != XFER_OK ) {
			verb(VERB_2, "[%s] transfer: %s", __func__, xfer_status_str(status));
		}
	}

	text.clear();
	scanner.flush(text);
	if ( !text.empty() ) {
		env->write_local(text.data(), text.size());
	}

	session->peer_gone = 1;
	char wake = WAKE_BYTE;
	if ( write(session->wake_pipe[1], &wake, 1) != 1 ) {
		verb(VERB_1, "[%s] unable to wake the session: %s", __func__, strerror(errno));
	}

	unregister_self();
	return NULL;
}


static int is_exit_line(const std::string& line)
{
	size_t start = 0, end = line.size();

	while ( start < end && isspace((unsigned char)line[start]) ) {
		start++;
	}
	while ( end > start && isspace((unsigned char)line[end - 1]) ) {
		end--;
	}

	return end - start == 4 && !strncasecmp(line.c_str() + start, "exit", 4);
}


int connect_session(Environment* env, int sock, const char* peer_addr, const session_opts_t* opts)
{
	client_session_t* session = new client_session_t();
	std::string line;
	int ret_val = RET_SUCCESS;

	session->env = env;
	session->sock = sock;
	session->peer_gone = 0;
	strncpy(session->peer_addr, peer_addr, MAX_ADDR_LEN - 1);

	if ( create_session_ciphers(opts->password, &session->encrypto, &session->decrypto) ) {
		env->writeln("Unable to set up encryption for %s.", peer_addr);
		close(sock);
		delete session;
		return RET_FAILURE;
	}

	if ( pipe(session->wake_pipe) ) {
		env->writeln("Unable to start the session: %s", strerror(errno));
		close(sock);
		delete session->encrypto;
		delete session->decrypto;
		delete session;
		return RET_FAILURE;
	}

	session->conn.connect_streams(sock, sock, session->encrypto, session->decrypto);
	session->conn.set_download_path(opts->download_path);

	init_debug_output_file(LOG_ROLE_CLIENT);
	env->writeln("Connected to %s", peer_addr);

	int timer = new_timer("client session");
	if ( timer >= 0 ) {
		start_timer(timer);
	}

	if ( create_thread(&session->reader, NULL, client_reader, session, "reader", THREAD_TYPE_READER) ) {
		env->writeln("Unable to start the reading thread.");
		ret_val = RET_FAILURE;
	} else {
		while ( 1 ) {
			int ready = env->wait_input(session->wake_pipe[0]);
			if ( ready <= 0 ) {
				// woken by the reader, the host is gone
				break;
			}

			int rs = env->readln(line);
			if ( rs < 0 ) {
				ret_val = RET_FAILURE;
				break;
			}
			if ( rs == 0 ) {
				// end of input ends the session the same way exit does
				line = "exit";
			}

			std::string out = line + "\n";
			session->conn.lock_transfer();
			ssize_t ws = stream_write_fully(sock, out.data(), out.size());
			if ( ws == (ssize_t)out.size() ) {
				session->conn.add_sent(ws);
			}
			session->conn.unlock_transfer();

			if ( ws != (ssize_t)out.size() ) {
				verb(VERB_2, "[%s] unable to forward input, host gone", __func__);
				break;
			}
			if ( is_exit_line(line) ) {
				break;
			}
		}

		// unblocks the reader's pending read
		shutdown(sock, SHUT_RDWR);
		pthread_join(session->reader, NULL);
		verb(VERB_2, "[%s] %s", __func__, session->peer_gone ? "host closed the session" : "session closed locally");
	}

	print_session_stats(env, &session->conn, timer);
	session->conn.disconnect_streams();

	env->writeln("Disconnected from %s", peer_addr);
	init_debug_output_file(LOG_ROLE_LOCAL);

	close(sock);
	close(session->wake_pipe[0]);
	close(session->wake_pipe[1]);
	delete session->encrypto;
	delete session->decrypto;
	delete session;

	return ret_val;
}
