/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

	This file is part of myshell,
	being the registry of the reader and progress threads

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
#ifndef THREAD_MANAGER_H
#define THREAD_MANAGER_H

#include <pthread.h>
#include "debug_output.h"

#define MAX_TRACKED_THREADS     32
#define MAX_THREAD_LABEL        32

typedef enum : unsigned char {
	THREAD_TYPE_NONE,
	THREAD_TYPE_READER,		// client side of a session, reads the host's output
	THREAD_TYPE_PROGRESS,	// one per file being reported on
	THREAD_TYPE_ALL,
	NUM_THREAD_TYPES
} thread_type_t;

typedef struct thread_slot_t {
	pthread_t		id;
	char			label[MAX_THREAD_LABEL];
	thread_type_t	type;		// THREAD_TYPE_NONE when the slot is free
} thread_slot_t;

void init_thread_manager(void);

// starts start_routine and tracks it under label, returns pthread_create's result
int create_thread(pthread_t* thread_id, const pthread_attr_t *attr, void *(*start_routine) (void *), void *arg, const char* label, thread_type_t threadType);

// called by a tracked thread as its last act
int unregister_self(void);

int get_thread_count(thread_type_t threadType);
void print_threads(verb_t verbosity);

void set_thread_exit(void);
int check_for_exit(thread_type_t threadType);

#endif // THREAD_MANAGER_H
