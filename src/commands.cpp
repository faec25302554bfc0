/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the built in and network commands of the shell

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
#include <getopt.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>

#include "commands.h"
#include "environment.h"
#include "session.h"
#include "transfer.h"
#include "network.h"
#include "files.h"
#include "util.h"

#define HOST_USAGE      "HOST [<port>] [--pass|-p <password>] [--reverse|-r] [--download-path|-d <path>]"
#define CONNECT_USAGE   "CONNECT <host> <port> [--pass|-p <password>] [--reverse|-r] [--download-path|-d <path>]"
#define DOWNLOAD_USAGE  "DOWNLOAD <path>"
#define UPLOAD_USAGE    "UPLOAD <path>"

static std::string g_download_path;

void set_default_download_path(const std::string& path)
{
	g_download_path = path;
}

std::string get_default_download_path()
{
	if ( !g_download_path.empty() ) {
		return g_download_path;
	}

	const char* home = getenv("HOME");
	if ( !home ) {
		char cwd[MAX_PATH_LEN];
		home = getcwd(cwd, sizeof(cwd)) ? cwd : "/tmp";
		return std::string(home) + "/Downloads";
	}
	return std::string(home) + "/Downloads";
}

static int all_digits(const char* str)
{
	for ( ; *str; str++ ) {
		if ( !isdigit((unsigned char)*str) ) {
			return 0;
		}
	}
	return 1;
}

static void report_bad_port(Environment* env, const char* str)
{
	if ( !all_digits(str) ) {
		env->writeln("Port must be numeric");
	} else {
		env->writeln("Port must be between 1 and 65535");
	}
}

//
// parse_session_flags
//
// the flags HOST and CONNECT share, getopt_long starts over on every call.
// --reverse swaps the roles on both: HOST --reverse drives the peer and
// CONNECT --reverse serves it. Returns the index of the first positional
// argument or -1
//
static int parse_session_flags(Environment* env, int argc, char** argv, const char* usage, session_opts_t* opts)
{
	static struct option long_options[] =
	{
		{"pass"             , required_argument     , NULL      , 'p'},
		{"reverse"          , no_argument           , NULL      , 'r'},
		{"download-path"    , required_argument     , NULL      , 'd'},
		{0, 0, 0, 0}
	};
	int opt;

	opts->password = "";
	opts->download_path = get_default_download_path();
	opts->reverse = 0;

	optind = 0;
	opterr = 0;

	while ( (opt = getopt_long(argc, argv, "p:rd:", long_options, NULL)) != -1 ) {
		switch (opt) {
			case 'p':
				opts->password = optarg;
				break;

			case 'r':
				opts->reverse = 1;
				break;

			case 'd':
				if ( resolve_path(env->get_cwd(), env->connection.get_marks(), optarg, opts->download_path) ) {
					env->writeln("Invalid download path %s", optarg);
					return -1;
				}
				break;

			default:
				env->writeln("Unknown option %s", argv[optind - 1]);
				env->writeln("Syntax: %s", usage);
				return -1;
		}
	}

	return optind;
}


cmd_status_t cmd_host(Environment* env, int argc, char** argv)
{
	session_opts_t opts;
	char peer_addr[MAX_ADDR_LEN];
	int port = 0, bound_port = 0;

	int first = parse_session_flags(env, argc, argv, HOST_USAGE, &opts);
	if ( first < 0 ) {
		return CMD_CONTINUE;
	}
	if ( argc - first > 1 ) {
		env->writeln("Syntax: %s", HOST_USAGE);
		return CMD_CONTINUE;
	}
	if ( first < argc && parse_port(argv[first], 1, &port) ) {
		report_bad_port(env, argv[first]);
		return CMD_CONTINUE;
	}
	if ( env->is_attached() ) {
		env->writeln("A remote session is already running.");
		return CMD_CONTINUE;
	}

	int listen_fd = tcp_listen(port, &bound_port);
	if ( listen_fd < 0 ) {
		env->writeln("Unable to listen on port %d: %s", port, strerror(errno));
		return CMD_CONTINUE;
	}

	std::string lan = get_local_ip_address();
	std::string pub = get_public_ip_address();
	env->writeln("Hosting server... connect to %s:%d / %s:%d", lan.c_str(), bound_port, pub.c_str(), bound_port);

	int sock = tcp_accept(listen_fd, peer_addr);
	close(listen_fd);
	if ( sock < 0 ) {
		env->writeln("Unable to accept a connection: %s", strerror(errno));
		return CMD_CONTINUE;
	}

	verb(VERB_2, "[%s] %s accepted, %s", __func__, peer_addr, opts.reverse ? "reverse" : "host");

	if ( opts.reverse ) {
		connect_session(env, sock, peer_addr, &opts);
	} else {
		host_session(env, sock, peer_addr, &opts);
	}

	return CMD_CONTINUE;
}


cmd_status_t cmd_connect(Environment* env, int argc, char** argv)
{
	session_opts_t opts;
	char peer_addr[MAX_ADDR_LEN];
	int port;

	int first = parse_session_flags(env, argc, argv, CONNECT_USAGE, &opts);
	if ( first < 0 ) {
		return CMD_CONTINUE;
	}
	if ( argc - first != 2 ) {
		env->writeln("Syntax: %s", CONNECT_USAGE);
		return CMD_CONTINUE;
	}
	if ( parse_port(argv[first + 1], 0, &port) ) {
		report_bad_port(env, argv[first + 1]);
		return CMD_CONTINUE;
	}
	if ( env->is_attached() ) {
		env->writeln("A remote session is already running.");
		return CMD_CONTINUE;
	}

	const char* host = argv[first];
	int sock = tcp_connect(host, port);
	if ( sock < 0 ) {
		env->writeln("Unable to connect to %s:%d", host, port);
		return CMD_CONTINUE;
	}

	snprintf(peer_addr, sizeof(peer_addr), "%s:%d", host, port);
	verb(VERB_2, "[%s] connected to %s, %s", __func__, peer_addr, opts.reverse ? "serving" : "driving");

	if ( opts.reverse ) {
		host_session(env, sock, peer_addr, &opts);
	} else {
		connect_session(env, sock, peer_addr, &opts);
	}

	return CMD_CONTINUE;
}


//
// cmd_download
//
// runs on the host, sends a path to the peer whose reading thread receives it
//
cmd_status_t cmd_download(Environment* env, int argc, char** argv)
{
	std::string resolved;
	struct stat stats;
	int failed = 0, total = 0;

	if ( !env->is_attached() ) {
		env->writeln(NOT_CONNECTED_MSG);
		return CMD_CONTINUE;
	}
	if ( argc != 2 ) {
		env->writeln("Syntax: %s", DOWNLOAD_USAGE);
		return CMD_CONTINUE;
	}

	if ( resolve_path(env->get_cwd(), env->connection.get_marks(), argv[1], resolved)
		 || stat(resolved.c_str(), &stats) ) {
		env->writeln("The system cannot find the path specified: %s", argv[1]);
		return CMD_CONTINUE;
	}

	xfer_status_t status = send_path(&env->connection, env, resolved.c_str(), &failed, &total);
	if ( status == XFER_CONNECTION_ENDED ) {
		// nobody is left to read the prompt
		return CMD_TERMINATE;
	}

	if ( S_ISDIR(stats.st_mode) ) {
		env->writeln_local("Finished uploading %s", resolved.c_str());
	}
	verb(VERB_2, "[%s] %s: %d of %d entries failed", __func__, resolved.c_str(), failed, total);

	return CMD_CONTINUE;
}


//
// cmd_upload
//
// runs on the host, asks the peer to send a path of its own
//
cmd_status_t cmd_upload(Environment* env, int argc, char** argv)
{
	if ( !env->is_attached() ) {
		env->writeln(NOT_CONNECTED_MSG);
		return CMD_CONTINUE;
	}
	if ( argc != 2 ) {
		env->writeln("Syntax: %s", UPLOAD_USAGE);
		return CMD_CONTINUE;
	}

	Connection* conn = &env->connection;
	xfer_status_t status = request_upload(conn, env, argv[1], conn->get_download_path());
	if ( status == XFER_CONNECTION_ENDED ) {
		return CMD_TERMINATE;
	}
	if ( status != XFER_OK ) {
		verb(VERB_2, "[%s] %s: %s", __func__, argv[1], xfer_status_str(status));
	}

	return CMD_CONTINUE;
}


int register_network_commands(postmaster_t* postmaster)
{
	int ret_val = POSTMASTER_OK;

	ret_val |= register_command(postmaster, "host", HOST_USAGE, cmd_host);
	ret_val |= register_command(postmaster, "connect", CONNECT_USAGE, cmd_connect);
	ret_val |= register_command(postmaster, "download", DOWNLOAD_USAGE, cmd_download);
	ret_val |= register_command(postmaster, "upload", UPLOAD_USAGE, cmd_upload);

	return ret_val == POSTMASTER_OK ? RET_SUCCESS : RET_FAILURE;
}
