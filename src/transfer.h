/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the encrypted entry protocol of DOWNLOAD and UPLOAD

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
#ifndef TRANSFER_H
#define TRANSFER_H

#include <stdint.h>
#include <string>

#include "connection.h"
#include "files.h"

class Environment;

/*
 Wire protocol of one entry, the receiver answers every step with one
 signal byte before the sender goes on:

   sender                          receiver
   __DOWNLOAD_START           ->
                              <-   1 accepted
   relative name              ->
                              <-   1 name ok / 0 refused
   type byte (0 file, 1 dir)  ->
                              <-   dir only: 1 created / 0 failed, done
   ciphertext size, decimal   ->
                              <-   1 size received
                              <-   1 ready / 0 not ready
   ciphertext, exactly size   ->
                              <-   1 done / 0 failed
*/

#define SIGNAL_FAILURE      0
#define SIGNAL_SUCCESS      1

#define ENTRY_FILE          0
#define ENTRY_DIR           1

// names and sizes are read with one read into a buffer this big
#define XFER_NAME_BUF       1024
#define XFER_CHUNK          4096

typedef enum : int8_t {
	XFER_OK,
	XFER_ENTRY_FAILED,			// local I/O on one side, the session goes on
	XFER_BAD_PASSWORD,			// padding check failed on the receiver
	XFER_REFUSED,				// the peer answered 0
	XFER_CONNECTION_ENDED,		// EOF, reset or broken pipe, the session is over
	NUM_XFER_STATUSES
} xfer_status_t;

const char* xfer_status_str(xfer_status_t status);

// progress lines while entries are sent or received
void set_transfer_progress(int enabled);

xfer_status_t send_signal(Connection* conn, int signal);

// bytes that are not a signal are kept for the shell's next readln
xfer_status_t wait_for_signal(Connection* conn, int* signal);

// one entry of a walk, the sender's side of steps 1 to 6
xfer_status_t send_entry(Connection* conn, Environment* env, const file_object_t* file);

// sends path and, for a directory, everything below it. Failed entries
// are counted in failed, a lost connection stops the walk
xfer_status_t send_path(Connection* conn, Environment* env, const char* path, int* failed, int* total);

// receiver's side of one entry, called once the download marker was read
xfer_status_t receive_entry(Connection* conn, Environment* env, const std::string& dest_dir);

// asks the peer to send path and receives into dest_dir until the peer
// ends the request
xfer_status_t request_upload(Connection* conn, Environment* env, const char* path, const std::string& dest_dir);

// peer's side of request_upload, called once the upload marker was read
xfer_status_t serve_upload_request(Connection* conn, Environment* env);

#endif // TRANSFER_H
