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

#include "state.h"
#include "debug_output.h"

static const char* state_names[NUM_XFER_STATES] = {
    "IDLE",
    "AWAIT_ACCEPT",
    "NAME_EXCHANGE",
    "TYPE_EXCHANGE",
    "SIZE_EXCHANGE",
    "AWAIT_READY",
    "CONTENT",
    "COMPLETE"
};

void state_init(xfer_state_holder_t* holder)
{
    holder->state = XFER_STATE_IDLE;
    pthread_mutex_init(&holder->lock, NULL);
}

void state_destroy(xfer_state_holder_t* holder)
{
    pthread_mutex_destroy(&holder->lock);
}

int set_state(xfer_state_holder_t* holder, xfer_state_t state)
{
    int ret_val = STATE_OK;

    if ( state < NUM_XFER_STATES ) {
        pthread_mutex_lock(&holder->lock);
        verb(VERB_4, "[%s] %s -> %s", __func__, state_names[holder->state], state_names[state]);
        holder->state = state;
        pthread_mutex_unlock(&holder->lock);
    } else {
        ret_val = STATE_INVALID_STATE;
    }

    return ret_val;
}

xfer_state_t get_state(xfer_state_holder_t* holder)
{
    xfer_state_t state;

    pthread_mutex_lock(&holder->lock);
    state = holder->state;
    pthread_mutex_unlock(&holder->lock);

    return state;
}

const char* xfer_state_name(xfer_state_t state)
{
    if ( state < NUM_XFER_STATES ) {
        return state_names[state];
    }
    return "UNKNOWN";
}
