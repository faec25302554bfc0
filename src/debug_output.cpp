/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the handler of the debug output

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
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <errno.h>
#include <stdarg.h>
#include <ctype.h>
#include <pthread.h>
#include <execinfo.h>

#define MAX_LOG_FILE_NAME_LEN   1024
#define BACKTRACE_DEPTH         32
#define MAX_DUMP_LINE           32
#define MIN_INT(a, b)           ((a) < (b) ? (a) : (b))

#include "debug_output.h"

static verb_t g_verbosity = VERB_1;
static int g_debug_file_logging = 0;

static const char g_logfilename_prefix[] = "myshell";
static const char g_logfilename_suffix[] = "log";
static char g_full_log_filename[MAX_LOG_FILE_NAME_LEN] = "";

// the client's reading thread and the progress threads log alongside the
// foreground, keep their lines whole
static pthread_mutex_t g_log_mutex = PTHREAD_MUTEX_INITIALIZER;

static const char* role_names[NUM_LOG_ROLES] = { "local", "host", "client" };

void set_verbosity_level(verb_t verbosity)
{
	g_verbosity = verbosity;
}

verb_t get_verbosity_level()
{
	return(g_verbosity);
}

void set_file_logging(int log_state)
{
	g_debug_file_logging = log_state;
}

int get_file_logging()
{
	return(g_debug_file_logging);
}

const char* get_log_file_name()
{
	return g_full_log_filename;
}

//
// init_debug_output_file
//
// points file logging at myshell-<role>.log in the working directory, the
// role changes when a session is hosted or connected
//
int init_debug_output_file(log_role_t role)
{
	char tmpPath[MAX_LOG_FILE_NAME_LEN / 2];

	if ( role >= NUM_LOG_ROLES ) {
		role = LOG_ROLE_LOCAL;
	}

	if ( !getcwd(tmpPath, sizeof(tmpPath)) ) {
		snprintf(tmpPath, sizeof(tmpPath), ".");
	}

	pthread_mutex_lock(&g_log_mutex);
	snprintf(g_full_log_filename, MAX_LOG_FILE_NAME_LEN, "%s/%s-%s.%s",
		tmpPath, g_logfilename_prefix, role_names[role], g_logfilename_suffix);
	pthread_mutex_unlock(&g_log_mutex);

	if ( g_debug_file_logging > 0 ) {
		FILE* debug_file = fopen(g_full_log_filename, "a");
		if ( !debug_file ) {
			g_debug_file_logging = 0;
			verb(VERB_2, "[%s] unable to open log file %s, error %d", __func__, g_full_log_filename, errno);
			return -1;
		}
		fclose(debug_file);
		verb(VERB_2, "********");
		verb(VERB_2, "[%s] log file opened as %s", __func__, g_full_log_filename);
	}
	return 0;
}

// caller holds g_log_mutex
static void emit(FILE* out, const char* prefix, const char* fmt, va_list args)
{
	if ( prefix ) {
		fputs(prefix, out);
	}
	vfprintf(out, fmt, args);
	fputc('\n', out);
}

// caller holds g_log_mutex
static void emit_to_log_file(const char* prefix, const char* fmt, va_list args)
{
	if ( g_debug_file_logging <= 0 || !g_full_log_filename[0] ) {
		return;
	}
	FILE* debug_file = fopen(g_full_log_filename, "a");
	if ( debug_file ) {
		emit(debug_file, prefix, fmt, args);
		fclose(debug_file);
	}
}

//
// verb
//
// stderr when the level is selected, the log file whenever file logging is on
//
void verb(verb_t verbosity, const char* fmt, ... )
{
	va_list args;

	pthread_mutex_lock(&g_log_mutex);
	if ( g_verbosity >= verbosity ) {
		va_start(args, fmt);
		emit(stderr, NULL, fmt, args);
		va_end(args);
	}
	va_start(args, fmt);
	emit_to_log_file(NULL, fmt, args);
	va_end(args);
	pthread_mutex_unlock(&g_log_mutex);
}

// silenced only at VERB_0
void warn(const char* fmt, ... )
{
	va_list args;

	pthread_mutex_lock(&g_log_mutex);
	if ( g_verbosity > VERB_0 ) {
		va_start(args, fmt);
		emit(stderr, "warning: ", fmt, args);
		va_end(args);
	}
	va_start(args, fmt);
	emit_to_log_file("warning: ", fmt, args);
	va_end(args);
	pthread_mutex_unlock(&g_log_mutex);
}


// on SIGSEGV, see myshell.cpp
void print_backtrace()
{
	void *trace[BACKTRACE_DEPTH];
	int size = backtrace(trace, BACKTRACE_DEPTH);

	fprintf(stderr, "\nmyshell backtrace (%d frames):\n", size);
	backtrace_symbols_fd(trace, size, STDERR_FILENO);
}


//
// print_bytes
//
// hex and printable dump of a buffer at VERB_4, line_len bytes a line
//
void print_bytes(const char* data, int length, int line_len)
{
	if ( g_verbosity < VERB_4 || length <= 0 ) {
		return;
	}
	if ( line_len <= 0 || line_len > MAX_DUMP_LINE ) {
		line_len = MAX_DUMP_LINE;
	}

	char hex[MAX_DUMP_LINE * 3 + 1];
	char ascii[MAX_DUMP_LINE + 1];

	for ( int offset = 0; offset < length; offset += line_len ) {
		int n = MIN_INT(line_len, length - offset);
		int h = 0;

		for ( int i = 0; i < line_len; i++ ) {
			if ( i < n ) {
				unsigned char c = (unsigned char)data[offset + i];
				h += snprintf(hex + h, sizeof(hex) - h, "%02X ", c);
				ascii[i] = isprint(c) ? (char)c : '.';
			} else {
				h += snprintf(hex + h, sizeof(hex) - h, "-- ");
				ascii[i] = ' ';
			}
		}
		ascii[line_len] = '\0';
		verb(VERB_4, "%04x  %s %s", offset, hex, ascii);
	}
}
