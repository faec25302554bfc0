/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the command loop

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
#ifndef SHELL_H
#define SHELL_H

#include <string>
#include <vector>

#include "postmaster.h"

class Environment;

#define PROMPT_SYMBOL   '>'
#define MAX_ARGS        64

// splits on whitespace, "double quoted" text is one token.
// RET_FAILURE on an unterminated quote or too many tokens
int tokenize(const std::string& line, std::vector<std::string>& tokens);

// builds the command table, builtins and network commands
int init_shell();
void destroy_shell();

postmaster_t* get_shell_postmaster();

cmd_status_t execute_line(Environment* env, const std::string& line);

// prompts, reads and runs commands from env until exit or end of input.
// Re-entered by HOST with env attached to the peer
int run_shell(Environment* env);

#endif // SHELL_H
