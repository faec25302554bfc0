/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

	This file is part of myshell,
	being the process wide options and start up

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
#ifndef MYSHELL_H
#define MYSHELL_H

#include "files.h"
#include "debug_output.h"

typedef struct myshell_opts_t {
	int verbosity;
	int progress;
	int debug;
	char download_path[MAX_PATH_LEN];
} myshell_opts_t;

extern myshell_opts_t g_opts;

void usage(int exit_stat);

// sets the defaults of g_opts
int set_defaults();

// parse the command line arguments, returns optind
int get_options(int argc, char* argv[]);

// SIGINT cleans up and exits, SIGSEGV prints a backtrace, SIGPIPE is
// reported by the failing write instead
int set_handlers();

// options, logging, handlers and the command table
void init_myshell(int argc, char* argv[]);

void cleanup_myshell();

#endif // MYSHELL_H
