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

#define _FILE_OFFSET_BITS 64

#include <sys/types.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>
#include <errno.h>
#include <fcntl.h>
#include <ctype.h>

#include <vector>

#include "util.h"
#include "files.h"

// step backwards up a given directory path
int get_parent_dir(char parent_dir[MAX_PATH_LEN], const char* path)
{
    memset(parent_dir, 0, MAX_PATH_LEN);
    const char* cursor = path + strlen(path);

    while (cursor > path && *cursor != '/') {
        cursor--;
    }

    if (cursor <= path) {
        // "/name" has / as its parent, "name" has none
        if ( *path == '/' ) {
            parent_dir[0] = '/';
        }
    } else {
        if ( cursor - path >= MAX_PATH_LEN ) {
            return RET_FAILURE;
        }
        memcpy(parent_dir, path, cursor-path);
    }

    return RET_SUCCESS;
}


int print_file_LL(verb_t verbosity, file_LL *list)
{
    if ( list == NULL ) {
        return RET_FAILURE;
    }

    for ( file_node_t* node = list->head; node != NULL; node = node->next ) {
        verb(verbosity, "    %s [%s]", node->curr->path, node->curr->filetype);
    }

    return RET_SUCCESS;
}

static const struct {
    mode_t      mode;
    const char* name;
} file_type_names[] = {
    { S_IFREG,  "regular file" },
    { S_IFDIR,  "directory" },
    { S_IFLNK,  "symlink" },
    { S_IFIFO,  "named pipe" },
    { S_IFSOCK, "socket" },
    { S_IFCHR,  "character device" },
    { S_IFBLK,  "block device" },
};

// entries follow symlinks, a link to a file is sent as the file
file_object_t* new_file_object(const char* path, const char* root)
{
    struct stat stats;

    if ( stat(path, &stats) == -1 ) {
        warn("unable to stat file [%s]: %s", path, strerror(errno));
        return NULL;
    }

    file_object_t* file = (file_object_t*)calloc(1, sizeof(file_object_t));
    if ( !file ) {
        ERR("unable to allocate file object");
    }

    file->stats = stats;
    file->path = strdup(path);
    file->root = strdup(root ? root : "");
    file->mode = stats.st_mode & S_IFMT;
    file->filetype = (char*)"unknown";
    if ( file->mode == S_IFREG ) {
        file->length = stats.st_size;
    }

    for ( size_t i = 0; i < sizeof(file_type_names) / sizeof(file_type_names[0]); i++ ) {
        if ( file_type_names[i].mode == (mode_t)file->mode ) {
            file->filetype = (char*)file_type_names[i].name;
            break;
        }
    }

    return file;
}

// NULL list starts a new one; unreadable paths are skipped
file_LL* add_file_to_list(file_LL *fileList, const char* path, const char* root)
{
    verb(VERB_4, "[%s] path = %s, root = %s", __func__, path, root);

    file_object_t* entry = new_file_object(path, root);
    if ( !entry ) {
        return fileList;
    }

    file_node_t* node = (file_node_t*)calloc(1, sizeof(file_node_t));
    if ( !node ) {
        ERR("unable to allocate file list node");
    }
    node->curr = entry;

    if ( !fileList ) {
        fileList = (file_LL*)calloc(1, sizeof(file_LL));
        if ( !fileList ) {
            ERR("unable to allocate file list");
        }
        fileList->head = node;
    } else {
        fileList->tail->next = node;
    }
    fileList->tail = node;
    fileList->count++;

    return fileList;
}


//
// build_full_filelist
//
// the top entry goes first, so the receiver sees each directory before
// anything that lives in it. root is the top entry's parent, entry names
// sent to the peer start below it
//
file_LL* build_full_filelist(const char* path)
{
    file_LL *fileList = NULL;
    char parent_dir[MAX_PATH_LEN];

    verb(VERB_2, "[%s] walking %s", __func__, path);

    if ( get_parent_dir(parent_dir, path) != RET_SUCCESS ) {
        warn("path too long [%s]", path);
        return NULL;
    }

    fileList = add_file_to_list(fileList, path, parent_dir);
    if ( fileList && fileList->head->curr->mode == S_IFDIR ) {
        lsdir_to_list(fileList, path, parent_dir);
    }

    if ( fileList ) {
        verb(VERB_2, "[%s] complete, %u entries", __func__, fileList->count);
        print_file_LL(VERB_3, fileList);
    }
    return fileList;
}


void lsdir_to_list(file_LL* ls_fileList, const char* dir, const char* root)
{
    struct dirent** entries = NULL;

    verb(VERB_3, "[%s] %s %s", __func__, dir, root);

    // sorted so both ends of a transfer log entries in the same order
    int n = scandir(dir, &entries, NULL, alphasort);
    if ( n < 0 ) {
        warn("unable to list directory [%s]: %s", dir, strerror(errno));
        return;
    }

    for ( int i = 0; i < n; i++ ) {
        const char* name = entries[i]->d_name;

        // ignore the current and parent directories
        if ( strcmp(name, ".") && strcmp(name, "..") ) {
            char path[MAX_PATH_LEN];
            if ( snprintf(path, MAX_PATH_LEN, "%s/%s", dir, name) >= MAX_PATH_LEN ) {
                warn("path too long, skipping [%s/%s]", dir, name);
            } else {
                struct stat link_stats;
                add_file_to_list(ls_fileList, path, root);
                // links to directories are sent as empty directories
                if ( !lstat(path, &link_stats) && S_ISDIR(link_stats.st_mode) ) {
                    lsdir_to_list(ls_fileList, path, root);
                }
            }
        }
        free(entries[i]);
    }
    free(entries);
}


//
// mkdir_parent
//
// creates path and any missing parents, an existing directory is fine
//
int mkdir_parent(const char* path)
{
    const mode_t dir_mode = S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH;
    struct stat stats;

    if ( !path || !path[0] ) {
        return RET_SUCCESS;
    }

    if ( mkdir(path, dir_mode) == 0 ) {
        verb(VERB_2, "Built directory %s", path);
        return RET_SUCCESS;
    }

    switch ( errno ) {
        case EEXIST:
            if ( stat(path, &stats) || !S_ISDIR(stats.st_mode) ) {
                verb(VERB_2, "[%s] %s exists and is not a directory", __func__, path);
                return RET_FAILURE;
            }
            return RET_SUCCESS;

        case ENOENT: {
            char parent_dir[MAX_PATH_LEN];
            if ( get_parent_dir(parent_dir, path) || !parent_dir[0] || mkdir_parent(parent_dir) ) {
                return RET_FAILURE;
            }
            if ( mkdir(path, dir_mode) && errno != EEXIST ) {
                verb(VERB_2, "[%s] unable to create directory [%s]: %s", __func__, path, strerror(errno));
                return RET_FAILURE;
            }
            verb(VERB_2, "Built directory %s", path);
            return RET_SUCCESS;
        }

        default:
            verb(VERB_2, "[%s] unable to create directory [%s]: %s", __func__, path, strerror(errno));
            return RET_FAILURE;
    }
}


int relative_name(const file_object_t* file, char name[MAX_PATH_LEN])
{
    const char* cursor = file->path;
    size_t root_len = strlen(file->root);

    // "/" as root keeps no separator of its own
    if ( root_len && !strncmp(file->path, file->root, root_len) ) {
        cursor += root_len;
    }
    while ( *cursor == '/' ) {
        cursor++;
    }

    if ( strlen(cursor) >= MAX_PATH_LEN || !strlen(cursor) ) {
        return RET_FAILURE;
    }

    snprintf(name, MAX_PATH_LEN, "%s", cursor);
    return RET_SUCCESS;
}


int first_available(const char* path, std::string& available)
{
    struct stat stats;

    available = path;
    if ( lstat(path, &stats) ) {
        return RET_SUCCESS;
    }

    std::string full(path);
    size_t slash = full.rfind('/');
    std::string dir = (slash == std::string::npos) ? "" : full.substr(0, slash + 1);
    std::string name = (slash == std::string::npos) ? full : full.substr(slash + 1);
    std::string extension;

    // a leading dot is a hidden file, not an extension
    size_t dot = name.rfind('.');
    if ( dot != std::string::npos && dot > 0 ) {
        extension = name.substr(dot);
        name = name.substr(0, dot);
    }

    for ( int index = 0; index >= 0; index++ ) {
        char suffix[32];
        snprintf(suffix, sizeof(suffix), "-%d", index);
        available = dir + name + suffix + extension;
        if ( lstat(available.c_str(), &stats) ) {
            return RET_SUCCESS;
        }
    }

    return RET_FAILURE;
}


int require_disk_space(const char* dir, off_t bytes)
{
    struct statvfs fs;

    if ( statvfs(dir, &fs) ) {
        verb(VERB_2, "[%s] unable to stat filesystem of %s: %s", __func__, dir, strerror(errno));
        return RET_FAILURE;
    }

    unsigned long long available = (unsigned long long)fs.f_bavail * fs.f_frsize;
    if ( bytes > 0 && available < (unsigned long long)bytes ) {
        verb(VERB_2, "[%s] %llu bytes free, %lld needed", __func__, available, (long long)bytes);
        return RET_FAILURE;
    }

    return RET_SUCCESS;
}


std::string join_path(const std::string& dir, const std::string& name)
{
    if ( dir.empty() ) {
        return name;
    }
    if ( dir[dir.size() - 1] == '/' ) {
        return dir + name;
    }
    return dir + "/" + name;
}


std::string normalize_path(const std::string& path)
{
    std::vector<std::string> parts;
    size_t pos = 0;

    while ( pos <= path.size() ) {
        size_t next = path.find('/', pos);
        if ( next == std::string::npos ) {
            next = path.size();
        }
        std::string part = path.substr(pos, next - pos);
        if ( part == ".." ) {
            if ( !parts.empty() ) {
                parts.pop_back();
            }
        } else if ( !part.empty() && part != "." ) {
            parts.push_back(part);
        }
        pos = next + 1;
    }

    std::string normalized;
    for ( size_t i = 0; i < parts.size(); i++ ) {
        normalized += "/" + parts[i];
    }
    return normalized.empty() ? "/" : normalized;
}


int resolve_path(const std::string& cwd, const marks_t& marks, const char* arg, std::string& resolved)
{
    if ( !arg || !strlen(arg) ) {
        return RET_FAILURE;
    }

    // a bare number picks an entry of the last listing
    const char* cursor = arg;
    while ( isdigit((unsigned char)*cursor) ) {
        cursor++;
    }
    if ( !*cursor && !marks.empty() ) {
        marks_t::const_iterator mark = marks.find(atoi(arg));
        if ( mark != marks.end() ) {
            resolved = mark->second;
            return RET_SUCCESS;
        }
    }

    std::string path(arg);
    if ( path[0] == '~' && (path.size() == 1 || path[1] == '/') ) {
        const char* home = getenv("HOME");
        if ( !home ) {
            return RET_FAILURE;
        }
        path = std::string(home) + path.substr(1);
    } else if ( path[0] != '/' ) {
        path = cwd + "/" + path;
    }

    resolved = normalize_path(path);
    return RET_SUCCESS;
}


// Free a given file object
void free_file_object(file_object_t* file)
{
    if ( file != NULL ) {
        free(file->path);
        free(file->root);
        free(file);
    }
}

// Free a given file list
void free_file_list(file_LL* fileList)
{
    if ( fileList != NULL ) {
        file_node_t* cursor = fileList->head;
        while ( cursor != NULL ) {
            file_node_t* next = cursor->next;
            free_file_object(cursor->curr);
            free(cursor);
            cursor = next;
        }
        free(fileList);
    }
}
