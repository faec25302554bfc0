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

#ifndef DEBUG_OUTPUT_H
#define DEBUG_OUTPUT_H

/*
Levels of Verbosity:
 VERB_0: Withhold WARNING messages
 VERB_1: Update user on file transfers
 VERB_2: Update user on underlying processes, i.e. directory creation
 VERB_3: Protocol steps of every transfer entry
 VERB_4: Every read and write on the session streams
*/

typedef enum{
    VERB_0,
    VERB_1,
    VERB_2,
    VERB_3,
    VERB_4
} verb_t;

typedef enum : unsigned char {
    LOG_ROLE_LOCAL,
    LOG_ROLE_HOST,
    LOG_ROLE_CLIENT,
    NUM_LOG_ROLES
} log_role_t;

int init_debug_output_file(log_role_t role);

void set_verbosity_level(verb_t verbosity);

void set_file_logging(int log_state);

int get_file_logging();

verb_t get_verbosity_level();

const char* get_log_file_name();

void verb(verb_t verbosity, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

void warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void print_backtrace();

void print_bytes(const char* data, int length, int line_len);

#endif // DEBUG_OUTPUT_H
