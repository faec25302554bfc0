/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the transfer state machine

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

#ifndef STATE_H
#define STATE_H

#include <stdint.h>
#include <pthread.h>

// sender side of one entry, every step waits for the receiver's signal
typedef enum : uint8_t {
    XFER_STATE_IDLE,
    XFER_STATE_AWAIT_ACCEPT,
    XFER_STATE_NAME_EXCHANGE,
    XFER_STATE_TYPE_EXCHANGE,
    XFER_STATE_SIZE_EXCHANGE,
    XFER_STATE_AWAIT_READY,
    XFER_STATE_CONTENT,
    XFER_STATE_COMPLETE,
    NUM_XFER_STATES
} xfer_state_t;

typedef enum : int8_t {
    STATE_INVALID_STATE = -1,
    STATE_OK = 0
} state_status_t;

// read from other threads while a transfer runs, e.g. by tests
typedef struct xfer_state_holder_t {
    xfer_state_t    state;
    pthread_mutex_t lock;
} xfer_state_holder_t;

void state_init(xfer_state_holder_t* holder);

void state_destroy(xfer_state_holder_t* holder);

int set_state(xfer_state_holder_t* holder, xfer_state_t state);

xfer_state_t get_state(xfer_state_holder_t* holder);

const char* xfer_state_name(xfer_state_t state);

#endif //STATE_H
