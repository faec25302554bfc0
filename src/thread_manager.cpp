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

#include <stdio.h>
#include <string.h>

#include "thread_manager.h"
#include "debug_output.h"

static thread_slot_t g_slots[MAX_TRACKED_THREADS];
static int g_tracked = 0;
static volatile int g_exit_requested = 0;
static pthread_mutex_t g_slots_mutex = PTHREAD_MUTEX_INITIALIZER;

static const char* type_name(thread_type_t type)
{
	switch ( type ) {
		case THREAD_TYPE_READER:    return "reader";
		case THREAD_TYPE_PROGRESS:  return "progress";
		case THREAD_TYPE_ALL:       return "all";
		default:                    return "none";
	}
}

// caller holds g_slots_mutex
static int count_locked(thread_type_t type)
{
	if ( type >= THREAD_TYPE_ALL ) {
		return g_tracked;
	}

	int count = 0;
	for ( int i = 0; i < MAX_TRACKED_THREADS; i++ ) {
		if ( g_slots[i].type == type ) {
			count++;
		}
	}
	return count;
}


void init_thread_manager(void)
{
	pthread_mutex_lock(&g_slots_mutex);
	g_exit_requested = 0;
	g_tracked = 0;
	memset(g_slots, 0, sizeof(g_slots));
	pthread_mutex_unlock(&g_slots_mutex);
}

//
// create_thread
//
// the slot is taken under the same lock as pthread_create so a thread
// that finishes at once still finds itself in the table
//
int create_thread(pthread_t* thread_id, const pthread_attr_t *attr, void *(*start_routine) (void *), void *arg, const char* label, thread_type_t threadType)
{
	if ( threadType == THREAD_TYPE_NONE || threadType >= THREAD_TYPE_ALL ) {
		threadType = THREAD_TYPE_READER;
	}

	pthread_mutex_lock(&g_slots_mutex);

	int slot = -1;
	for ( int i = 0; i < MAX_TRACKED_THREADS; i++ ) {
		if ( g_slots[i].type == THREAD_TYPE_NONE ) {
			slot = i;
			break;
		}
	}
	if ( slot < 0 ) {
		pthread_mutex_unlock(&g_slots_mutex);
		verb(VERB_1, "[%s] no free slot for thread %s", __func__, label);
		return -1;
	}

	int ret = pthread_create(thread_id, attr, start_routine, arg);
	if ( !ret ) {
		g_slots[slot].id = *thread_id;
		g_slots[slot].type = threadType;
		snprintf(g_slots[slot].label, MAX_THREAD_LABEL, "%s", label);
		g_tracked++;
	}
	int tracked = g_tracked;
	pthread_mutex_unlock(&g_slots_mutex);

	if ( ret ) {
		verb(VERB_1, "[%s] unable to start thread %s: %s", __func__, label, strerror(ret));
	} else {
		verb(VERB_2, "[%s] %s thread %s started, %d tracked", __func__, type_name(threadType), label, tracked);
	}
	return ret;
}


int unregister_self(void)
{
	pthread_t self = pthread_self();

	pthread_mutex_lock(&g_slots_mutex);
	for ( int i = 0; i < MAX_TRACKED_THREADS; i++ ) {
		if ( g_slots[i].type != THREAD_TYPE_NONE && pthread_equal(g_slots[i].id, self) ) {
			memset(&g_slots[i], 0, sizeof(g_slots[i]));
			g_tracked--;
			break;
		}
	}
	int tracked = g_tracked;
	pthread_mutex_unlock(&g_slots_mutex);

	verb(VERB_2, "[%s] %d threads still tracked", __func__, tracked);
	return tracked;
}


int get_thread_count(thread_type_t threadType)
{
	pthread_mutex_lock(&g_slots_mutex);
	int count = count_locked(threadType);
	pthread_mutex_unlock(&g_slots_mutex);

	return count;
}


void print_threads(verb_t verbosity)
{
	pthread_mutex_lock(&g_slots_mutex);
	for ( int i = 0; i < MAX_TRACKED_THREADS; i++ ) {
		if ( g_slots[i].type != THREAD_TYPE_NONE ) {
			verb(verbosity, "%d: %s thread %s", i, type_name(g_slots[i].type), g_slots[i].label);
		}
	}
	pthread_mutex_unlock(&g_slots_mutex);
}


void set_thread_exit(void)
{
	verb(VERB_2, "[%s] asking tracked threads to finish", __func__);
	g_exit_requested = 1;
}

//
// check_for_exit
//
// a reader keeps going while progress threads of its transfer are alive
//
int check_for_exit(thread_type_t threadType)
{
	if ( !g_exit_requested ) {
		return 0;
	}
	if ( threadType != THREAD_TYPE_READER ) {
		return 1;
	}

	pthread_mutex_lock(&g_slots_mutex);
	int progress = count_locked(THREAD_TYPE_PROGRESS);
	pthread_mutex_unlock(&g_slots_mutex);

	return progress == 0;
}
