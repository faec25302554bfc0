/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the table that routes command names to their handlers

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

#ifndef POSTMASTER_H
#define POSTMASTER_H

#include <stdint.h>

class Environment;

#define MAX_COMMANDS        32
#define MAX_COMMAND_NAME    32

typedef enum : uint8_t {
    CMD_CONTINUE,
    CMD_TERMINATE           // leave the shell loop the command ran in
} cmd_status_t;

typedef enum : uint8_t {
    POSTMASTER_OK = 0,
    POSTMASTER_ERROR_UNKNOWN_CMD,
    POSTMASTER_ERROR_CALLBACK_NULL,
    POSTMASTER_ERROR_POSTMASTER_NULL,
    POSTMASTER_ERROR_FULL,
    NUM_POSTMASTER_STATUSES
} postmaster_error_t;

typedef cmd_status_t (*command_callback_t)(Environment* env, int argc, char** argv);

typedef struct command_t {

    char                name[MAX_COMMAND_NAME];
    const char*         usage;
    command_callback_t  callback;

} command_t;

typedef struct postmaster_t {

    command_t   commands[MAX_COMMANDS];
    int         count;

} postmaster_t;

// creates a postmaster for later use
postmaster_t* create_postmaster();

// destroys an existing postmaster
void destroy_postmaster(postmaster_t* postmaster);

// register a callback with a postmaster for a command name, a name that is
// already known gets the new callback
int register_command(postmaster_t* postmaster, const char* name, const char* usage, command_callback_t callback);

// NULL when the name is unknown, case is ignored
const command_t* find_command(postmaster_t* postmaster, const char* name);

// runs the command named by argv[0], its result goes to status
int dispatch_command(postmaster_t* postmaster, Environment* env, int argc, char** argv, cmd_status_t* status);

#endif //POSTMASTER_H
