/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the file, path and directory helpers

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

#ifndef FILES_H
#define FILES_H

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>

#include <map>
#include <string>

#include "debug_output.h"

#define MAX_PATH_LEN 1024

// a received entry is written under its name plus this suffix until complete
#define PARTIAL_FILE_SUFFIX ".part"

// one entry of a transfer walk
typedef struct file_object_t {
    struct stat stats;
    int         mode;       // S_IFMT bits of stats
    off_t       length;     // 0 unless a regular file
    char        *filetype;  // printable mode, not owned
    char        *path;
    char        *root;      // parent of the walk's top entry
} file_object_t;

typedef struct file_node_t {
    file_object_t*      curr;
    struct file_node_t* next;
} file_node_t;

typedef struct file_LL {
    file_node_t*    head;
    file_node_t*    tail;
    unsigned int    count;
} file_LL;

// mark number from the last listing to the absolute path it showed
typedef std::map<int, std::string> marks_t;

int print_file_LL(verb_t verbosity, file_LL *list);

// NULL if path can not be stat'ed
file_object_t* new_file_object(const char* path, const char* root);

file_LL* add_file_to_list(file_LL *fileList, const char* path, const char* root);

// path and, for a directory, everything below it in pre-order with each
// directory's entries sorted by name. NULL if path does not exist
file_LL* build_full_filelist(const char* path);

void lsdir_to_list(file_LL* ls_fileList, const char* dir, const char* root);

int mkdir_parent(const char* path);

// "" for a bare name, "/" for a name right below the root
int get_parent_dir(char parent_dir[MAX_PATH_LEN], const char* path);

// name of the entry below its root, always with forward slashes
int relative_name(const file_object_t* file, char name[MAX_PATH_LEN]);

// path itself if free, otherwise name-0.ext, name-1.ext, ...
int first_available(const char* path, std::string& available);

// RET_FAILURE if the filesystem holding dir has less than bytes free
int require_disk_space(const char* dir, off_t bytes);

// dir + "/" + name with a single separator, "/" stays the root
std::string join_path(const std::string& dir, const std::string& name);

// collapses ".", ".." and repeated separators of an absolute path
std::string normalize_path(const std::string& path);

// turns what the user typed into an absolute path: a mark number, an
// absolute path, ~ or a path relative to cwd
int resolve_path(const std::string& cwd, const marks_t& marks, const char* arg, std::string& resolved);

void free_file_object(file_object_t* file);
void free_file_list(file_LL* fileList);

#endif // FILES_H
