/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being helpers shared by the test suites

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
#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <fcntl.h>
#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <sys/stat.h>

#include <fstream>
#include <sstream>
#include <string>

static int remove_entry(const char* path, const struct stat* stats, int type, struct FTW* ftw)
{
    return remove(path);
}

// a fresh directory under /tmp, removed with everything in it
class TempDir
{
 private:
    std::string path;

 public:
    TempDir()
    {
        char templ[] = "/tmp/myshell-test-XXXXXX";
        char* made = mkdtemp(templ);
        path = made ? made : "";
    }

    ~TempDir()
    {
        if ( !path.empty() ) {
            nftw(path.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
        }
    }

    const std::string& str() const { return path; }

    std::string sub(const std::string& name) const { return path + "/" + name; }
};

static inline void write_file(const std::string& path, const std::string& data)
{
    std::ofstream out(path.c_str(), std::ios::binary | std::ios::trunc);
    out.write(data.data(), data.size());
}

static inline std::string read_file(const std::string& path)
{
    std::ifstream in(path.c_str(), std::ios::binary);
    std::stringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

static inline bool exists(const std::string& path)
{
    struct stat stats;
    return !lstat(path.c_str(), &stats);
}

static inline bool is_dir(const std::string& path)
{
    struct stat stats;
    return !stat(path.c_str(), &stats) && S_ISDIR(stats.st_mode);
}

// deterministic bytes that are not all the same
static inline std::string pattern(size_t len, unsigned seed = 7)
{
    std::string data(len, '\0');
    unsigned state = seed;
    for ( size_t i = 0; i < len; i++ ) {
        state = state * 1103515245u + 12345u;
        data[i] = (char)(state >> 16);
    }
    return data;
}

// an fd the environment can write to without reaching the terminal
static inline int null_fd()
{
    return open("/dev/null", O_RDWR);
}

#endif // TEST_HELPERS_H
