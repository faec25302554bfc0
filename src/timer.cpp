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

#include <pthread.h>
#include <stdio.h>
#include <string.h>

#include "timer.h"

static named_timer_t g_timers[N_TIMERS];
static int g_timers_used = 0;
static pthread_mutex_t g_timer_mutex = PTHREAD_MUTEX_INITIALIZER;

static int valid_tag(int tag)
{
	return tag >= 0 && tag < N_TIMERS;
}

int init_timers()
{
	pthread_mutex_lock(&g_timer_mutex);
	memset(g_timers, 0, sizeof(g_timers));
	g_timers_used = 0;
	pthread_mutex_unlock(&g_timer_mutex);

	return 0;
}

int new_timer(const char* str)
{
	int tag = -1;

	pthread_mutex_lock(&g_timer_mutex);
	for (int i = 0; i < g_timers_used; i++) {
		if (!strncmp(g_timers[i].descrip, str, MAX_DESCRIP_LEN - 1)) {
			tag = i;
			break;
		}
	}
	if (tag < 0 && g_timers_used < N_TIMERS) {
		tag = g_timers_used++;
		snprintf(g_timers[tag].descrip, MAX_DESCRIP_LEN, "%s", str);
	}
	pthread_mutex_unlock(&g_timer_mutex);

	if (tag < 0) {
		verb(VERB_2, "[%s] timer table full, %s not timed", __func__, str);
	}
	return tag;
}

void get_time(timespec* now)
{
	clock_gettime(CLOCK_MONOTONIC, now);
}

void start_timer(int tag)
{
	if (!valid_tag(tag)) {
		return;
	}
	get_time(&g_timers[tag].started);
	g_timers[tag].running = 1;
	g_timers[tag].ever_started = 1;
}

int stop_timer(int tag)
{
	if (!valid_tag(tag)) {
		return -1;
	}
	g_timers[tag].running = 0;
	return clock_gettime(CLOCK_MONOTONIC, &g_timers[tag].stopped);
}

double diff(timespec start, timespec end)
{
	time_t sec = end.tv_sec - start.tv_sec;
	long nsec = end.tv_nsec - start.tv_nsec;

	if (nsec < 0) {
		sec--;
		nsec += 1000000000L;
	}
	return sec + nsec / 1.0e9;
}

double timer_elapsed(int tag)
{
	if (!valid_tag(tag) || !g_timers[tag].ever_started) {
		return 0.0;
	}

	if (g_timers[tag].running) {
		timespec now;
		get_time(&now);
		return diff(g_timers[tag].started, now);
	}
	return diff(g_timers[tag].started, g_timers[tag].stopped);
}

void print_timers(verb_t verbosity)
{
	int used;

	pthread_mutex_lock(&g_timer_mutex);
	used = g_timers_used;
	pthread_mutex_unlock(&g_timer_mutex);

	verb(verbosity, "Timers:");
	for (int i = 0; i < used; i++) {
		verb(verbosity, "%s\t%f", g_timers[i].descrip, timer_elapsed(i));
	}
}
