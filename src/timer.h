/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the named monotonic timers

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

/*
A session keeps one timer under its description; asking for a description
that is already in the table returns the same slot.

   init_timers();
   int t = new_timer("host session");
   start_timer(t);
   ....
   stop_timer(t);
   verb(VERB_1, "%.1f s", timer_elapsed(t));

   print_timers(VERB_3);
*/

#ifndef TIMER_H
#define TIMER_H

#include <time.h>

#include "debug_output.h"

typedef struct timespec timespec;

#define N_TIMERS 32
#define MAX_DESCRIP_LEN 48

typedef struct named_timer_t {
	char		descrip[MAX_DESCRIP_LEN];
	timespec	started;
	timespec	stopped;
	int			running;
	int			ever_started;
} named_timer_t;

int init_timers();

// -1 when the table is full
int new_timer(const char* str);

void start_timer(int tag);

int stop_timer(int tag);

// CLOCK_MONOTONIC
void get_time(timespec* now);

// seconds from start to end
double diff(timespec start, timespec end);

// seconds between start and stop, or up to now while still running
double timer_elapsed(int tag);

void print_timers(verb_t verbosity);

#endif
