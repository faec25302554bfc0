/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

	This file is part of myshell,
	being the command line options, signal handling and process shutdown

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

#include <getopt.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "myshell.h"
#include "commands.h"
#include "shell.h"
#include "transfer.h"
#include "thread_manager.h"
#include "timer.h"
#include "util.h"

myshell_opts_t g_opts;

typedef struct usage_line_t {
	const char* flag;
	const char* text;
} usage_line_t;

static const usage_line_t usage_lines[] = {
	{ "--help (-h)",                "print this message" },
	{ "--verbose (-v)",             "report underlying steps, same as --verbosity 2" },
	{ "--quiet",                    "no warnings, same as --verbosity 0" },
	{ "--verbosity <0-4>",          "0 quiet, 1 transfers [default], 2 processes, 3 protocol steps, 4 stream bytes" },
	{ "--debug (-b)",               "also log to myshell-<role>.log in the working directory" },
	{ "--download-path (-d) <path>", "where received entries go [default ~/Downloads]" },
	{ "--no-progress (-x)",         "do not report transfer progress" },
	{ NULL, NULL }
};

void usage(int exit_stat)
{
	fprintf(stderr, "usage: myshell [options]\n\noptions:\n");
	for ( int i = 0; usage_lines[i].flag; i++ ) {
		fprintf(stderr, "  %-30s %s\n", usage_lines[i].flag, usage_lines[i].text);
	}

	fprintf(stderr, "\nremote sessions are started from the prompt:\n"
		"  HOST [<port>] [--pass <password>] [--reverse] [--download-path <path>]\n"
		"  CONNECT <host> <port> [--pass <password>] [--reverse] [--download-path <path>]\n"
		"  DOWNLOAD <path> | UPLOAD <path>   while connected\n");

	exit(exit_stat);
}


// how long a normal exit waits on reader and progress threads
#define EXIT_WAIT_SEC       10
#define EXIT_POLL_USEC      1000

//
// clean_exit
//
// asks tracked threads to finish and waits on them unless failing
//
void clean_exit(int status)
{
	verb(VERB_2, "[%s] exiting with %d", __func__, status);
	print_timers(VERB_3);
	set_thread_exit();

	if ( status != EXIT_FAILURE ) {
		timespec start, now;
		get_time(&start);
		get_time(&now);

		while ( get_thread_count(THREAD_TYPE_ALL) > 0 && diff(start, now) < EXIT_WAIT_SEC ) {
			usleep(EXIT_POLL_USEC);
			get_time(&now);
		}
		if ( get_thread_count(THREAD_TYPE_ALL) > 0 ) {
			verb(VERB_1, "[%s] leaving %d threads behind", __func__, get_thread_count(THREAD_TYPE_ALL));
			print_threads(VERB_2);
		}
	}

	destroy_shell();
	exit(status);
}


static void default_and_raise(int signum)
{
	signal(signum, SIG_DFL);
	raise(signum);
}

void sig_handler(int signum)
{
	switch ( signum ) {
		case SIGINT:
			verb(VERB_0, "\n[%d] interrupted, cleaning up", getpid());
			clean_exit(EXIT_FAILURE);
			break;

		case SIGSEGV:
			verb(VERB_0, "\n[%d] segmentation fault", getpid());
			print_backtrace();
			// re-raised with the default action
			default_and_raise(SIGSEGV);
			break;

		default:
			break;
	}
}


int set_defaults()
{
	memset(&g_opts, 0, sizeof(g_opts));
	g_opts.verbosity = VERB_1;
	g_opts.progress = 1;

	return RET_SUCCESS;
}


//
// get_options
//
// returns the index of the first argument that is not an option
//
int get_options(int argc, char *argv[])
{
	static struct option long_options[] =
	{
		{ "help",           no_argument,        NULL,               'h' },
		{ "verbose",        no_argument,        NULL,               'v' },
		{ "quiet",          no_argument,        &g_opts.verbosity,  VERB_0 },
		{ "verbosity",      required_argument,  NULL,               'V' },
		{ "debug",          no_argument,        NULL,               'b' },
		{ "download-path",  required_argument,  NULL,               'd' },
		{ "no-progress",    no_argument,        NULL,               'x' },
		{ 0, 0, 0, 0 }
	};

	int opt;
	int option_index = 0;

	while ( (opt = getopt_long(argc, argv, "hvbd:x", long_options, &option_index)) != -1 ) {
		switch ( opt ) {
			case 0:
				break;

			case 'h':
				usage(EXIT_SUCCESS);
				break;

			case 'v':
				g_opts.verbosity = VERB_2;
				break;

			case 'V':
				ERR_IF(sscanf(optarg, "%d", &g_opts.verbosity) != 1, "verbosity must be a number, got %s", optarg);
				ERR_IF(g_opts.verbosity < VERB_0 || g_opts.verbosity > VERB_4, "verbosity must be between 0 and 4");
				break;

			case 'b':
				g_opts.debug = 1;
				set_file_logging(1);
				break;

			case 'd':
				snprintf(g_opts.download_path, MAX_PATH_LEN, "%s", optarg);
				break;

			case 'x':
				g_opts.progress = 0;
				break;

			default:
				usage(EXIT_FAILURE);
				break;
		}
	}

	set_verbosity_level((verb_t)g_opts.verbosity);
	if ( g_opts.verbosity == VERB_0 ) {
		g_opts.progress = 0;
	}

	return optind;
}


int set_handlers()
{
	if ( signal(SIGINT, sig_handler) == SIG_ERR ) {
		warn("[%s] unable to set the SIGINT handler", __func__);
		return RET_FAILURE;
	}

	if ( signal(SIGSEGV, sig_handler) == SIG_ERR ) {
		warn("[%s] unable to set the SIGSEGV handler", __func__);
		return RET_FAILURE;
	}

	// a peer that leaves mid-write shows up as EPIPE on the write
	if ( signal(SIGPIPE, SIG_IGN) == SIG_ERR ) {
		warn("[%s] unable to ignore SIGPIPE", __func__);
		return RET_FAILURE;
	}

	return RET_SUCCESS;
}


void init_myshell(int argc, char *argv[])
{
	set_defaults();

	for ( int i = get_options(argc, argv); i < argc; i++ ) {
		verb(VERB_1, "Unused argument %s", argv[i]);
	}

	init_debug_output_file(LOG_ROLE_LOCAL);
	ERR_IF(set_handlers(), "unable to install signal handlers");

	init_thread_manager();
	init_timers();

	set_transfer_progress(g_opts.progress);
	if ( g_opts.download_path[0] ) {
		char cwd[MAX_PATH_LEN];
		std::string resolved;
		marks_t no_marks;

		ERR_IF(!getcwd(cwd, sizeof(cwd)), "unable to read the working directory");
		ERR_IF(resolve_path(cwd, no_marks, g_opts.download_path, resolved), "invalid download path %s", g_opts.download_path);
		set_default_download_path(resolved);
	}

	ERR_IF(init_shell(), "unable to set up the command table");

	verb(VERB_2, "[%s] myshell started as process %d", __func__, getpid());
}


void cleanup_myshell()
{
	clean_exit(EXIT_SUCCESS);
}
