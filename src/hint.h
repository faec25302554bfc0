/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the recognizer of transfer markers
    in the session's text stream

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
#ifndef HINT_H
#define HINT_H

#include <stdint.h>
#include <string>

// written raw into the session stream, no framing
#define DOWNLOAD_KEYWORD        "__DOWNLOAD_START"
#define UPLOAD_KEYWORD          "__UPLOAD_START"
#define TRANSFER_END_KEYWORD    "__TRANSFER_END"

typedef enum : uint8_t {
    HINT_NONE,
    HINT_DOWNLOAD,          // one entry follows, reader becomes receiver
    HINT_UPLOAD,            // peer asks us to send a path
    HINT_END,               // no more entries for the current request
    NUM_HINTS
} hint_t;

const char* hint_keyword(hint_t hint);

// returns the hint whose marker the first bytes of buf match exactly,
// HINT_NONE otherwise
hint_t try_recognize_hint(const char* buf, int len);

//
// HintScanner
//
// splits the bytes read from a peer into displayable text and markers.
// A marker split across two reads is recognised: a trailing prefix of a
// marker is held back until the next read decides it.
//
class HintScanner
{
 private:
    std::string held;

 public:
    HintScanner() {}

    // appends the text preceding any marker to text and returns the marker
    // found, bytes after a marker are held for the next scan or flush
    hint_t scan(const char* buf, int len, std::string& text);

    // text held back at the end of the stream, it never became a marker
    void flush(std::string& text);

    int held_back() const { return (int)held.size(); }
};

#endif // HINT_H
