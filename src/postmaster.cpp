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

#include <stdlib.h>
#include <string.h>
#include <strings.h>

#include "postmaster.h"
#include "debug_output.h"

//
// create_postmaster
//
// the shell has a handful of commands, a linear scan over a fixed table
// does the lookup
//
postmaster_t* create_postmaster()
{
    return (postmaster_t*)calloc(1, sizeof(postmaster_t));
}

void destroy_postmaster(postmaster_t* postmaster)
{
    free(postmaster);
}

static command_t* lookup(postmaster_t* postmaster, const char* name)
{
    int i;

    for ( i = 0; i < postmaster->count; i++ ) {
        if ( !strcasecmp(postmaster->commands[i].name, name) ) {
            return &postmaster->commands[i];
        }
    }
    return NULL;
}

//
// register_command
//
// given a callback in the form cmd_status_t foo(Environment*, int, char**),
// adds it to the command table under name

int register_command(postmaster_t* postmaster, const char* name, const char* usage, command_callback_t callback)
{
    int ret_val = POSTMASTER_OK;

    if ( callback == NULL ) {
        ret_val = POSTMASTER_ERROR_CALLBACK_NULL;
    } else if ( postmaster != NULL ) {
        command_t* command = lookup(postmaster, name);
        if ( !command ) {
            if ( postmaster->count < MAX_COMMANDS ) {
                command = &postmaster->commands[postmaster->count++];
                strncpy(command->name, name, MAX_COMMAND_NAME - 1);
            } else {
                ret_val = POSTMASTER_ERROR_FULL;
            }
        }
        if ( command ) {
            command->usage = usage;
            command->callback = callback;
        }
    } else {
        ret_val = POSTMASTER_ERROR_POSTMASTER_NULL;
    }

    return ret_val;

}

const command_t* find_command(postmaster_t* postmaster, const char* name)
{
    if ( postmaster == NULL || name == NULL ) {
        return NULL;
    }
    return lookup(postmaster, name);
}

//
// dispatch_command
//
// dispatches a tokenized command line to the callback registered for argv[0]

int dispatch_command(postmaster_t* postmaster, Environment* env, int argc, char** argv, cmd_status_t* status)
{
    int ret_val = POSTMASTER_OK;

    *status = CMD_CONTINUE;

    if ( postmaster != NULL ) {
        const command_t* command = argc > 0 ? lookup(postmaster, argv[0]) : NULL;
        if ( command != NULL ) {
            if ( command->callback != NULL ) {
                verb(VERB_3, "[%s] %s, %d args", __func__, command->name, argc - 1);
                *status = command->callback(env, argc, argv);
            } else {
                ret_val = POSTMASTER_ERROR_CALLBACK_NULL;
            }
        } else {
            ret_val = POSTMASTER_ERROR_UNKNOWN_CMD;
        }
    } else {
        ret_val = POSTMASTER_ERROR_POSTMASTER_NULL;
    }

    return ret_val;
}
