/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

	This file is part of myshell,
	being the return codes and fatal error macros shared by every module

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
#ifndef _UTIL_H
#define _UTIL_H

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "debug_output.h"

#define RET_FAILURE -1
#define RET_SUCCESS 0

#define MIN(a,b) \
	({ __typeof__ (a) _a = (a); \
	__typeof__ (b) _b = (b); \
	_a > _b ? _b : _a; })

// unrecoverable setup or allocation failure: report where and shut down
#define ERR(fmt, ...)								\
	do {											\
		fprintf(stderr, "myshell: fatal: %s:%d: %s: ",	\
			__FILE__, __LINE__, __func__);			\
		fprintf(stderr, fmt, ##__VA_ARGS__);		\
		fprintf(stderr, "\n");						\
		clean_exit(EXIT_FAILURE);					\
	} while(0)

#define ERR_IF(f, fmt, ...)							\
	do {											\
		if ((f) != 0) {								\
			ERR(fmt, ##__VA_ARGS__);				\
		}											\
	} while(0)

// waits on tracked threads before exiting, see myshell.cpp
void clean_exit(int status);

#endif // _UTIL_H
