/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the transfer progress reporter

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
#ifndef PROGRESS_H
#define PROGRESS_H

#include <pthread.h>
#include <sys/types.h>
#include <time.h>

#include <string>

#define PROGRESS_FIRST_DELAY_SEC    1
#define PROGRESS_PERIOD_SEC         5

#define SIZE_B  1.0
#define SIZE_KB 1.0e3
#define SIZE_MB 1.0e6
#define SIZE_GB 1.0e9
#define SIZE_TB 1.0e12
#define SIZE_PB 1.0e15

class Environment;

// "1023 B", "1.5 KiB", "2.0 MiB"
std::string human_readable_byte_count(off_t bytes);

// "350 ms", "4 s", "2 min 5 s", "1 hr 3 min"
std::string human_readable_time(long long nanoseconds);

// ratio to scale size by for display, the matching label goes to label
double get_scale(off_t size, char* label);

//
// Progress
//
// counts the bytes of one transfer and reports throughput from a timer
// thread: first after PROGRESS_FIRST_DELAY_SEC, then every
// PROGRESS_PERIOD_SEC. Reports go to the local side of env, or the log
// when env is NULL.
//
class Progress
{
 private:
    Environment* env;
    off_t total;
    off_t current;
    off_t recent;
    int auto_stop;

    timespec start_time;
    timespec recent_start;

    int started;
    int stopping;
    pthread_t timer_thread;
    pthread_mutex_t lock;
    pthread_cond_t wake;

    static void* timer_loop(void* arg);

    Progress(const Progress&);
    Progress& operator=(const Progress&);

 public:
    Progress(Environment* env, off_t total, int auto_stop);
    ~Progress();

    int start();

    // safe before start() and when already stopped
    void stop();

    void add(off_t delta);

    // builds the report line and starts a new recent-speed window
    std::string report();

    // prints one report
    void tick();

    off_t get_total() const { return total; }
    off_t get_current();
    int is_running();
};

#endif // PROGRESS_H
