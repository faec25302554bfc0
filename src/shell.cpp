/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the command loop

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
#include <ctype.h>
#include <errno.h>
#include <dirent.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>
#include <sys/stat.h>

#include "shell.h"
#include "commands.h"
#include "environment.h"
#include "files.h"
#include "util.h"
#include "debug_output.h"

static postmaster_t* g_postmaster = NULL;

int tokenize(const std::string& line, std::vector<std::string>& tokens)
{
    std::string token;
    int in_token = 0;
    int quoted = 0;

    tokens.clear();

    for ( size_t i = 0; i < line.size(); i++ ) {
        char c = line[i];

        if ( c == '"' ) {
            quoted = !quoted;
            in_token = 1;
        } else if ( !quoted && isspace((unsigned char)c) ) {
            if ( in_token ) {
                tokens.push_back(token);
                token.clear();
                in_token = 0;
            }
        } else {
            token += c;
            in_token = 1;
        }
    }

    if ( quoted ) {
        verb(VERB_2, "[%s] unterminated quote", __func__);
        return RET_FAILURE;
    }
    if ( in_token ) {
        tokens.push_back(token);
    }

    return tokens.size() < MAX_ARGS ? RET_SUCCESS : RET_FAILURE;
}


static cmd_status_t cmd_exit(Environment* env, int argc, char** argv)
{
    return CMD_TERMINATE;
}

static cmd_status_t cmd_pwd(Environment* env, int argc, char** argv)
{
    env->writeln("%s", env->get_cwd().c_str());
    return CMD_CONTINUE;
}

static cmd_status_t cmd_cd(Environment* env, int argc, char** argv)
{
    std::string resolved;

    if ( resolve_path(env->get_cwd(), env->connection.get_marks(), argc > 1 ? argv[1] : "~", resolved) ) {
        env->writeln("Invalid path %s", argc > 1 ? argv[1] : "~");
        return CMD_CONTINUE;
    }
    if ( env->set_cwd(resolved) ) {
        env->writeln("%s is not a directory.", resolved.c_str());
    }
    return CMD_CONTINUE;
}

static int skip_dots(const struct dirent* entry)
{
    return strcmp(entry->d_name, ".") && strcmp(entry->d_name, "..");
}

//
// cmd_ls
//
// one line per entry, the number in <> marks the entry so later commands
// can name it by number
//
static cmd_status_t cmd_ls(Environment* env, int argc, char** argv)
{
    std::string dir;
    struct dirent** entries;
    marks_t marks;

    if ( resolve_path(env->get_cwd(), env->connection.get_marks(), argc > 1 ? argv[1] : ".", dir) ) {
        env->writeln("Invalid path %s", argv[1]);
        return CMD_CONTINUE;
    }

    int n = scandir(dir.c_str(), &entries, skip_dots, alphasort);
    if ( n < 0 ) {
        env->writeln("Unable to list %s: %s", dir.c_str(), strerror(errno));
        return CMD_CONTINUE;
    }

    for ( int i = 0; i < n; i++ ) {
        struct stat stats;
        char date[32] = "";
        std::string path = dir == "/" ? "/" + std::string(entries[i]->d_name) : dir + "/" + entries[i]->d_name;

        if ( !lstat(path.c_str(), &stats) ) {
            struct tm mtime;
            localtime_r(&stats.st_mtime, &mtime);
            strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &mtime);

            int id = i + 1;
            marks[id] = path;
            env->writeln("%c%c%c%c %11lld %s %s <%d>",
                S_ISDIR(stats.st_mode) ? 'd' : '-',
                access(path.c_str(), R_OK) ? '-' : 'r',
                access(path.c_str(), W_OK) ? '-' : 'w',
                access(path.c_str(), X_OK) ? '-' : 'x',
                (long long)stats.st_size, date, entries[i]->d_name, id);
        }
        free(entries[i]);
    }
    free(entries);

    env->connection.set_marks(marks);
    return CMD_CONTINUE;
}

static cmd_status_t cmd_help(Environment* env, int argc, char** argv)
{
    if ( argc > 1 ) {
        const command_t* command = find_command(g_postmaster, argv[1]);
        if ( !command ) {
            env->writeln("Unknown command %s", argv[1]);
        } else {
            env->writeln("%s", command->usage);
        }
        return CMD_CONTINUE;
    }

    for ( int i = 0; i < g_postmaster->count; i++ ) {
        env->writeln("%s", g_postmaster->commands[i].usage);
    }
    return CMD_CONTINUE;
}


int init_shell()
{
    if ( g_postmaster ) {
        return RET_SUCCESS;
    }

    g_postmaster = create_postmaster();
    if ( !g_postmaster ) {
        warn("unable to allocate the command table");
        return RET_FAILURE;
    }

    register_command(g_postmaster, "cd", "CD [<path>]", cmd_cd);
    register_command(g_postmaster, "pwd", "PWD", cmd_pwd);
    register_command(g_postmaster, "ls", "LS [<path>]", cmd_ls);
    register_command(g_postmaster, "help", "HELP [<command>]", cmd_help);
    register_command(g_postmaster, "exit", "EXIT", cmd_exit);

    return register_network_commands(g_postmaster);
}

void destroy_shell()
{
    destroy_postmaster(g_postmaster);
    g_postmaster = NULL;
}

postmaster_t* get_shell_postmaster()
{
    return g_postmaster;
}

cmd_status_t execute_line(Environment* env, const std::string& line)
{
    std::vector<std::string> tokens;
    std::vector<char*> argv;
    cmd_status_t status = CMD_CONTINUE;

    if ( tokenize(line, tokens) ) {
        env->writeln("Unable to parse the command line.");
        return CMD_CONTINUE;
    }
    if ( tokens.empty() ) {
        return CMD_CONTINUE;
    }

    for ( size_t i = 0; i < tokens.size(); i++ ) {
        argv.push_back(&tokens[i][0]);
    }
    argv.push_back(NULL);

    int ret = dispatch_command(g_postmaster, env, tokens.size(), &argv[0], &status);
    if ( ret == POSTMASTER_ERROR_UNKNOWN_CMD ) {
        env->writeln("Unrecognized command: %s", tokens[0].c_str());
    } else if ( ret != POSTMASTER_OK ) {
        warn("unable to dispatch %s, error %d", tokens[0].c_str(), ret);
    }

    return status;
}

int run_shell(Environment* env)
{
    std::string line;

    if ( init_shell() ) {
        return RET_FAILURE;
    }

    while ( 1 ) {
        const std::string& cwd = env->get_cwd();
        size_t slash = cwd.rfind('/');
        std::string name = (slash == std::string::npos || cwd.size() == 1) ? cwd : cwd.substr(slash + 1);
        std::string prompt = "$" + name + PROMPT_SYMBOL + " ";

        if ( env->write(prompt.data(), prompt.size()) ) {
            verb(VERB_2, "[%s] unable to write the prompt", __func__);
            return RET_FAILURE;
        }

        int ret = env->readln(line);
        if ( ret < 0 ) {
            verb(VERB_2, "[%s] read failed", __func__);
            return RET_FAILURE;
        }
        if ( ret == 0 ) {
            verb(VERB_2, "[%s] end of input", __func__);
            break;
        }

        if ( execute_line(env, line) == CMD_TERMINATE ) {
            break;
        }
    }

    return RET_SUCCESS;
}
