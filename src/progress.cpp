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
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/time.h>

#include "progress.h"
#include "environment.h"
#include "thread_manager.h"
#include "timer.h"
#include "util.h"
#include "debug_output.h"

#define NSEC_PER_SEC    1000000000LL

std::string human_readable_byte_count(off_t bytes)
{
    static const char* prefixes = "KMGTPE";
    char buf[32];

    if ( bytes < 1024 ) {
        snprintf(buf, sizeof(buf), "%lld B", (long long)bytes);
        return buf;
    }

    int exp = 0;
    double value = bytes;
    while ( value >= 1024.0 && exp < 6 ) {
        value /= 1024.0;
        exp++;
    }
    snprintf(buf, sizeof(buf), "%.1f %ciB", value, prefixes[exp - 1]);
    return buf;
}

std::string human_readable_time(long long nanoseconds)
{
    static const long long microsecond = 1000LL;
    static const long long millisecond = microsecond * 1000LL;
    static const long long second = millisecond * 1000LL;
    static const long long minute = second * 60LL;
    static const long long hour = minute * 60LL;
    static const long long day = hour * 24LL;
    char buf[32];
    long long remainder = 0;

    if ( nanoseconds < 0 ) {
        nanoseconds = 0;
    }

    if ( nanoseconds < microsecond ) {
        snprintf(buf, sizeof(buf), "%lld ns", nanoseconds);
    } else if ( nanoseconds < millisecond ) {
        snprintf(buf, sizeof(buf), "%lld us", nanoseconds / microsecond);
    } else if ( nanoseconds < second ) {
        snprintf(buf, sizeof(buf), "%lld ms", nanoseconds / millisecond);
    } else if ( nanoseconds < minute ) {
        snprintf(buf, sizeof(buf), "%lld s", nanoseconds / second);
    } else if ( nanoseconds < hour ) {
        snprintf(buf, sizeof(buf), "%lld min", nanoseconds / minute);
        remainder = nanoseconds % minute;
    } else if ( nanoseconds < day ) {
        snprintf(buf, sizeof(buf), "%lld hr", nanoseconds / hour);
        remainder = nanoseconds % hour;
    } else {
        snprintf(buf, sizeof(buf), "%lld d", nanoseconds / day);
        remainder = nanoseconds % day;
    }

    // below a second the remainder is noise
    if ( remainder >= second ) {
        return std::string(buf) + " " + human_readable_time(remainder);
    }
    return buf;
}


/*
 * double get_scale
 * - takes the transfer size and an allocated label string
 * - returns: the ratio to scale the transfer size to be human readable
 * - state  : writes the label for the scale to char*label
 */
double get_scale(off_t size, char* label)
{
    const char* tmpLabel;
    double  tmpSize;

    if (size < SIZE_KB){
        tmpLabel = "B";
        tmpSize = SIZE_B;
    } else if (size < SIZE_MB){
        tmpLabel = "KB";
        tmpSize = SIZE_KB;
    } else if (size < SIZE_GB){
        tmpLabel = "MB";
        tmpSize = SIZE_MB;
    } else if (size < SIZE_TB){
        tmpLabel = "GB";
        tmpSize = SIZE_GB;
    } else if (size < SIZE_PB){
        tmpLabel = "TB";
        tmpSize = SIZE_TB;
    } else {
        tmpLabel = "PB";
        tmpSize = SIZE_PB;
    }

    sprintf(label, "%s", tmpLabel);
    return tmpSize;
}


static long long nanos_between(const timespec& start, const timespec& end)
{
    return (long long)(diff(start, end) * NSEC_PER_SEC);
}


Progress::Progress(Environment* env, off_t total, int auto_stop)
{
    this->env = env;
    this->total = total;
    this->auto_stop = auto_stop;
    current = 0;
    recent = 0;
    started = 0;
    stopping = 0;

    get_time(&start_time);
    recent_start = start_time;

    pthread_mutex_init(&lock, NULL);

    pthread_condattr_t attr;
    pthread_condattr_init(&attr);
    pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
    pthread_cond_init(&wake, &attr);
    pthread_condattr_destroy(&attr);
}

Progress::~Progress()
{
    stop();
    pthread_cond_destroy(&wake);
    pthread_mutex_destroy(&lock);
}

int Progress::start()
{
    pthread_mutex_lock(&lock);
    if ( started ) {
        pthread_mutex_unlock(&lock);
        return RET_SUCCESS;
    }
    stopping = 0;
    started = 1;
    pthread_mutex_unlock(&lock);

    if ( create_thread(&timer_thread, NULL, &Progress::timer_loop, this, "progress", THREAD_TYPE_PROGRESS) ) {
        pthread_mutex_lock(&lock);
        started = 0;
        pthread_mutex_unlock(&lock);
        return RET_FAILURE;
    }

    return RET_SUCCESS;
}

void Progress::stop()
{
    pthread_mutex_lock(&lock);
    if ( !started || stopping ) {
        pthread_mutex_unlock(&lock);
        return;
    }
    stopping = 1;
    pthread_cond_signal(&wake);
    pthread_mutex_unlock(&lock);

    pthread_join(timer_thread, NULL);

    pthread_mutex_lock(&lock);
    started = 0;
    pthread_mutex_unlock(&lock);
}

void Progress::add(off_t delta)
{
    int reached;

    pthread_mutex_lock(&lock);
    current += delta;
    recent += delta;
    reached = (current >= total);
    pthread_mutex_unlock(&lock);

    if ( auto_stop && reached ) {
        stop();
    }
}

off_t Progress::get_current()
{
    pthread_mutex_lock(&lock);
    off_t value = current;
    pthread_mutex_unlock(&lock);
    return value;
}

int Progress::is_running()
{
    pthread_mutex_lock(&lock);
    int value = started && !stopping;
    pthread_mutex_unlock(&lock);
    return value;
}

std::string Progress::report()
{
    timespec now;
    char line[256];

    get_time(&now);

    pthread_mutex_lock(&lock);
    off_t done = current;
    off_t recent_bytes = recent;
    long long elapsed = nanos_between(start_time, now);
    long long recent_elapsed = nanos_between(recent_start, now);
    recent = 0;
    recent_start = now;
    pthread_mutex_unlock(&lock);

    int percent = total > 0 ? (int)(100 * done / total) : 100;

    off_t average_speed = elapsed > 0 ? (off_t)(done * (double)NSEC_PER_SEC / elapsed) : 0;
    off_t current_speed = recent_elapsed > 0 ? (off_t)(recent_bytes * (double)NSEC_PER_SEC / recent_elapsed) : 0;

    std::string eta = "unknown";
    if ( current_speed > 0 ) {
        off_t left = total > done ? total - done : 0;
        eta = human_readable_time((long long)(left * (double)NSEC_PER_SEC / current_speed));
    }

    snprintf(line, sizeof(line),
        "%2d%% processed (%s/%s), Elapsed time: %s, Average speed: %s/s, Current speed: %s/s, Estimated time: %s",
        percent,
        human_readable_byte_count(done).c_str(),
        human_readable_byte_count(total).c_str(),
        human_readable_time(elapsed).c_str(),
        human_readable_byte_count(average_speed).c_str(),
        human_readable_byte_count(current_speed).c_str(),
        eta.c_str());

    return line;
}

void Progress::tick()
{
    std::string line = report();

    if ( env ) {
        env->writeln_local("%s", line.c_str());
    } else {
        verb(VERB_1, "%s", line.c_str());
    }
}

void* Progress::timer_loop(void* arg)
{
    Progress* progress = (Progress*)arg;
    timespec deadline;
    int delay = PROGRESS_FIRST_DELAY_SEC;

    pthread_mutex_lock(&progress->lock);
    while ( !progress->stopping ) {
        get_time(&deadline);
        deadline.tv_sec += delay;

        int ret = 0;
        while ( !progress->stopping && ret != ETIMEDOUT ) {
            ret = pthread_cond_timedwait(&progress->wake, &progress->lock, &deadline);
        }
        if ( progress->stopping ) {
            break;
        }

        pthread_mutex_unlock(&progress->lock);
        progress->tick();
        pthread_mutex_lock(&progress->lock);

        delay = PROGRESS_PERIOD_SEC;
    }
    pthread_mutex_unlock(&progress->lock);

    unregister_self();
    return NULL;
}
