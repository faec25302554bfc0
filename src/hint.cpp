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
#include <string.h>

#include "hint.h"
#include "debug_output.h"

static const char* hint_keywords[NUM_HINTS] = {
    NULL,
    DOWNLOAD_KEYWORD,
    UPLOAD_KEYWORD,
    TRANSFER_END_KEYWORD
};

const char* hint_keyword(hint_t hint)
{
    if ( hint == HINT_NONE || hint >= NUM_HINTS ) {
        return "";
    }
    return hint_keywords[hint];
}

hint_t try_recognize_hint(const char* buf, int len)
{
    for ( int i = HINT_DOWNLOAD; i < NUM_HINTS; i++ ) {
        int key_len = strlen(hint_keywords[i]);
        if ( len >= key_len && !memcmp(buf, hint_keywords[i], key_len) ) {
            return (hint_t)i;
        }
    }
    return HINT_NONE;
}

// length of the longest suffix of data that is a proper prefix of a marker
static size_t partial_marker_suffix(const std::string& data)
{
    size_t longest = 0;

    for ( int i = HINT_DOWNLOAD; i < NUM_HINTS; i++ ) {
        size_t key_len = strlen(hint_keywords[i]);
        size_t max_len = key_len - 1;
        if ( max_len > data.size() ) {
            max_len = data.size();
        }
        for ( size_t n = max_len; n > longest; n-- ) {
            if ( !data.compare(data.size() - n, n, hint_keywords[i], n) ) {
                longest = n;
                break;
            }
        }
    }
    return longest;
}

hint_t HintScanner::scan(const char* buf, int len, std::string& text)
{
    std::string data;
    data.swap(held);
    if ( len > 0 ) {
        data.append(buf, len);
    }

    // text the peer wrote just before the marker can arrive in the same read
    for ( size_t pos = 0; pos < data.size(); pos++ ) {
        if ( data[pos] != '_' ) {
            continue;
        }
        hint_t hint = try_recognize_hint(data.data() + pos, data.size() - pos);
        if ( hint != HINT_NONE ) {
            text.append(data, 0, pos);
            size_t rest = pos + strlen(hint_keywords[hint]);
            if ( rest < data.size() ) {
                verb(VERB_3, "[%s] holding %zu bytes after %s", __func__, data.size() - rest, hint_keywords[hint]);
                held.assign(data, rest, std::string::npos);
            }
            return hint;
        }
    }

    size_t keep = partial_marker_suffix(data);
    text.append(data, 0, data.size() - keep);
    held.assign(data, data.size() - keep, keep);

    return HINT_NONE;
}

void HintScanner::flush(std::string& text)
{
    text.append(held);
    held.clear();
}
