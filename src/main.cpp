/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

	This file is part of myshell,
	being the local shell entry point

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

#include <unistd.h>

#include "myshell.h"
#include "environment.h"
#include "shell.h"
#include "util.h"

int main(int argc, char *argv[])
{
	init_myshell(argc, argv);

	Environment env(STDIN_FILENO, STDOUT_FILENO);

	env.writeln("Welcome to MyShell! You may enter commands.");
	if ( run_shell(&env) ) {
		warn("unable to read from the terminal");
	}
	env.writeln("Thank you for using this shell. Goodbye!");

	verb(VERB_2, "[%s] shell finished", __func__);
	cleanup_myshell();

	return RET_SUCCESS;
}
