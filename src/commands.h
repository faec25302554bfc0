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
#ifndef COMMANDS_H
#define COMMANDS_H

#include <string>

#include "postmaster.h"

class Environment;

#define NOT_CONNECTED_MSG   "You must be connected to a host to run this command!"

// where received entries go when a command does not say, $HOME/Downloads
// unless set
void set_default_download_path(const std::string& path);
std::string get_default_download_path();

cmd_status_t cmd_host(Environment* env, int argc, char** argv);
cmd_status_t cmd_connect(Environment* env, int argc, char** argv);
cmd_status_t cmd_download(Environment* env, int argc, char** argv);
cmd_status_t cmd_upload(Environment* env, int argc, char** argv);

int register_network_commands(postmaster_t* postmaster);

#endif // COMMANDS_H
