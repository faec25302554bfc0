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

#define _FILE_OFFSET_BITS 64

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>
#include <stdarg.h>
#include <ctype.h>
#include <unistd.h>

#include "util.h"
#include "transfer.h"
#include "environment.h"
#include "network.h"
#include "progress.h"
#include "hint.h"
#include "crypto.h"

static int g_transfer_progress = 1;

static const char* xfer_status_names[NUM_XFER_STATUSES] = {
	"ok",
	"entry failed",
	"incorrect password",
	"refused by peer",
	"connection ended"
};

const char* xfer_status_str(xfer_status_t status)
{
	if ( status < 0 || status >= NUM_XFER_STATUSES ) {
		return "unknown";
	}
	return xfer_status_names[status];
}

void set_transfer_progress(int enabled)
{
	g_transfer_progress = enabled;
}

// transfer messages stay on this side, the stream may be busy with the
// protocol
static void xfer_message(Environment* env, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
static void xfer_message(Environment* env, const char* fmt, ...)
{
	char line[2 * MAX_PATH_LEN];
	va_list args;

	va_start(args, fmt);
	vsnprintf(line, sizeof(line), fmt, args);
	va_end(args);

	if ( env ) {
		env->writeln_local("%s", line);
	} else {
		verb(VERB_1, "%s", line);
	}
}

static void trim(char* buf, int len)
{
	buf[len] = '\0';
	while ( len > 0 && (buf[len - 1] == '\0' || isspace((unsigned char)buf[len - 1])) ) {
		buf[--len] = '\0';
	}
	int start = 0;
	while ( start < len && isspace((unsigned char)buf[start]) ) {
		start++;
	}
	if ( start ) {
		memmove(buf, buf + start, len - start + 1);
	}
}

static xfer_status_t write_stream(Connection* conn, const char* data, size_t len)
{
	if ( stream_write_fully(conn->get_out_fd(), data, len) != (ssize_t)len ) {
		return XFER_CONNECTION_ENDED;
	}
	conn->add_sent(len);
	return XFER_OK;
}

// one read of at most XFER_NAME_BUF - 1 bytes, trimmed
static xfer_status_t read_field(Connection* conn, char buf[XFER_NAME_BUF])
{
	ssize_t rs = stream_read(conn->get_in_fd(), buf, XFER_NAME_BUF - 1);
	if ( rs <= 0 ) {
		return XFER_CONNECTION_ENDED;
	}
	conn->add_received(rs);
	trim(buf, rs);
	return XFER_OK;
}

// relative, no "..", no empty components
static int is_safe_name(const char* name)
{
	if ( !*name || *name == '/' ) {
		return 0;
	}

	const char* cursor = name;
	while ( *cursor ) {
		const char* slash = strchr(cursor, '/');
		size_t len = slash ? (size_t)(slash - cursor) : strlen(cursor);
		if ( len == 0 || (len == 2 && !strncmp(cursor, "..", 2)) ) {
			return 0;
		}
		if ( !slash ) {
			break;
		}
		cursor = slash + 1;
	}
	return 1;
}

xfer_status_t send_signal(Connection* conn, int signal)
{
	char byte = signal ? SIGNAL_SUCCESS : SIGNAL_FAILURE;

	verb(VERB_3, "[%s] %d", __func__, signal);
	return write_stream(conn, &byte, 1);
}

xfer_status_t wait_for_signal(Connection* conn, int* signal)
{
	char byte;

	while ( 1 ) {
		ssize_t rs = stream_read(conn->get_in_fd(), &byte, 1);
		if ( rs <= 0 ) {
			verb(VERB_2, "[%s] connection ended", __func__);
			return XFER_CONNECTION_ENDED;
		}
		conn->add_received(1);

		if ( byte == SIGNAL_SUCCESS || byte == SIGNAL_FAILURE ) {
			*signal = byte;
			verb(VERB_3, "[%s] %d", __func__, *signal);
			return XFER_OK;
		}

		// typed by the peer just before it saw our marker
		conn->unread(&byte, 1);
	}
}

// waits for the next signal, 0 turns into XFER_REFUSED
static xfer_status_t expect_success(Connection* conn)
{
	int signal = SIGNAL_FAILURE;
	xfer_status_t status = wait_for_signal(conn, &signal);

	if ( status != XFER_OK ) {
		return status;
	}
	return signal == SIGNAL_SUCCESS ? XFER_OK : XFER_REFUSED;
}


//
// send_file_content
//
// sends exactly post_size(plain_len) bytes of ciphertext whatever happens to
// the file. After a short read the rest is zeros and the last block ends in
// a zero byte instead of PKCS#7 padding, so the peer's padding check rejects
// the entry and its partial file is removed
//
static xfer_status_t send_file_content(Connection* conn, Environment* env, int fd, off_t plain_len, const char* name)
{
	char plain[XFER_CHUNK];
	char cipher[XFER_CHUNK + CRYPTO_BLOCK_SIZE];
	Crypto* enc = conn->get_encrypto();
	off_t sent_plain = 0;
	off_t announced = Crypto::post_size(plain_len);
	off_t written = 0;
	int read_failed = 0;
	xfer_status_t status;

	Progress progress(env, announced, 1);
	if ( g_transfer_progress ) {
		progress.start();
	}

	while ( sent_plain < plain_len ) {
		int want = MIN((off_t)XFER_CHUNK, plain_len - sent_plain);
		ssize_t rs = 0;

		if ( !read_failed ) {
			rs = read(fd, plain, want);
			if ( rs <= 0 ) {
				xfer_message(env, "Unable to read %s: %s", name, rs < 0 ? strerror(errno) : "file shrank");
				read_failed = 1;
			}
		}
		if ( read_failed ) {
			memset(plain, 0, want);
			rs = want;
		}

		int out_len = enc->update(plain, 0, rs, cipher);
		if ( out_len < 0 ) {
			ERR("cipher update failed while sending %s", name);
		}
		if ( (status = write_stream(conn, cipher, out_len)) != XFER_OK ) {
			progress.stop();
			enc->reset();
			return status;
		}
		written += out_len;
		sent_plain += rs;
		progress.add(out_len);
	}

	int out_len;
	if ( read_failed ) {
		int fill = CRYPTO_BLOCK_SIZE - (int)(plain_len % CRYPTO_BLOCK_SIZE);
		memset(plain, 0, fill);
		out_len = enc->update(plain, 0, fill, cipher);
		if ( out_len != CRYPTO_BLOCK_SIZE || enc->reset() != RET_SUCCESS ) {
			ERR("cipher update failed while closing %s", name);
		}
	} else if ( (out_len = enc->finalize(cipher)) < 0 ) {
		ERR("cipher finalize failed while sending %s", name);
	}
	if ( (status = write_stream(conn, cipher, out_len)) != XFER_OK ) {
		progress.stop();
		return status;
	}
	written += out_len;
	progress.add(out_len);
	progress.stop();

	verb(VERB_3, "[%s] %lld of %lld announced bytes written", __func__, (long long)written, (long long)announced);

	return read_failed ? XFER_ENTRY_FAILED : XFER_OK;
}


xfer_status_t send_entry(Connection* conn, Environment* env, const file_object_t* file)
{
	char name[MAX_PATH_LEN];
	char size_str[32];
	int fd = -1;
	off_t plain_len = 0;
	xfer_status_t status;

	if ( relative_name(file, name) != RET_SUCCESS ) {
		xfer_message(env, "Unable to send %s: bad name", file->path);
		return XFER_ENTRY_FAILED;
	}

	if ( file->mode != S_IFDIR && file->mode != S_IFREG ) {
		xfer_message(env, "Skipping %s: %s", name, file->filetype);
		return XFER_ENTRY_FAILED;
	}

	// a file we can't open never reaches the wire
	if ( file->mode == S_IFREG ) {
		struct stat stats;
		if ( (fd = open(file->path, O_RDONLY)) < 0 ) {
			xfer_message(env, "Unable to open %s: %s", file->path, strerror(errno));
			return XFER_ENTRY_FAILED;
		}
		if ( fstat(fd, &stats) ) {
			xfer_message(env, "Unable to stat %s: %s", file->path, strerror(errno));
			close(fd);
			return XFER_ENTRY_FAILED;
		}
		plain_len = stats.st_size;
	}

	verb(VERB_2, "[%s] sending [%s] %s", __func__, file->filetype, name);

	conn->set_send_state(XFER_STATE_AWAIT_ACCEPT);
	status = write_stream(conn, DOWNLOAD_KEYWORD, strlen(DOWNLOAD_KEYWORD));
	if ( status == XFER_OK ) {
		status = expect_success(conn);
	}

	if ( status == XFER_OK ) {
		conn->set_send_state(XFER_STATE_NAME_EXCHANGE);
		status = write_stream(conn, name, strlen(name));
		if ( status == XFER_OK ) {
			status = expect_success(conn);
		}
		if ( status == XFER_REFUSED ) {
			xfer_message(env, "Peer refused the name %s", name);
		}
	}

	if ( status == XFER_OK ) {
		char type = (file->mode == S_IFDIR) ? ENTRY_DIR : ENTRY_FILE;
		conn->set_send_state(XFER_STATE_TYPE_EXCHANGE);
		status = write_stream(conn, &type, 1);

		if ( status == XFER_OK && type == ENTRY_DIR ) {
			status = expect_success(conn);
			if ( status == XFER_REFUSED ) {
				xfer_message(env, "Peer was unable to create directory %s", name);
			}
			conn->set_send_state(XFER_STATE_IDLE);
			return status;
		}
	}

	if ( status == XFER_OK ) {
		off_t announced = Crypto::post_size(plain_len);
		conn->set_send_state(XFER_STATE_SIZE_EXCHANGE);
		snprintf(size_str, sizeof(size_str), "%lld", (long long)announced);
		status = write_stream(conn, size_str, strlen(size_str));
		if ( status == XFER_OK ) {
			status = expect_success(conn);
		}

		if ( status == XFER_OK ) {
			conn->set_send_state(XFER_STATE_AWAIT_READY);
			status = expect_success(conn);
			if ( status == XFER_REFUSED ) {
				xfer_message(env, "Peer is not ready to receive %s", name);
			}
		}

		if ( status == XFER_OK ) {
			std::string size_text = human_readable_byte_count(plain_len);
			xfer_message(env, "Uploading %s (%s)", name, size_text.c_str());

			conn->set_send_state(XFER_STATE_CONTENT);
			xfer_status_t content = send_file_content(conn, env, fd, plain_len, name);
			if ( content == XFER_CONNECTION_ENDED ) {
				status = content;
			} else {
				conn->set_send_state(XFER_STATE_COMPLETE);
				status = expect_success(conn);
				if ( status != XFER_CONNECTION_ENDED && content != XFER_OK ) {
					// the peer discarded what it got
					status = content;
				} else if ( status == XFER_OK ) {
					xfer_message(env, "Finished uploading %s (%s)", name, size_text.c_str());
				} else if ( status == XFER_REFUSED ) {
					xfer_message(env, "Peer failed to receive %s", name);
				}
			}
		}
	}

	if ( fd >= 0 ) {
		close(fd);
	}

	if ( status == XFER_CONNECTION_ENDED ) {
		xfer_message(env, "Connection ended while sending %s", name);
	}

	conn->set_send_state(XFER_STATE_IDLE);
	return status;
}


xfer_status_t send_path(Connection* conn, Environment* env, const char* path, int* failed, int* total)
{
	xfer_status_t status = XFER_OK;
	int failed_count = 0;

	file_LL* list = build_full_filelist(path);
	if ( !list ) {
		xfer_message(env, "Unable to read %s", path);
		if ( failed ) *failed = 1;
		if ( total ) *total = 1;
		return XFER_ENTRY_FAILED;
	}

	int count = list->count;
	for ( file_node_t* cursor = list->head; cursor != NULL; cursor = cursor->next ) {
		xfer_status_t entry = send_entry(conn, env, cursor->curr);
		if ( entry == XFER_CONNECTION_ENDED ) {
			status = entry;
			break;
		}
		if ( entry != XFER_OK ) {
			verb(VERB_2, "[%s] %s: %s", __func__, cursor->curr->path, xfer_status_str(entry));
			failed_count++;
		}
	}

	free_file_list(list);

	if ( status != XFER_CONNECTION_ENDED && failed_count ) {
		if ( count > 1 ) {
			xfer_message(env, "%d of %d entries failed", failed_count, count);
		}
		status = XFER_ENTRY_FAILED;
	}

	if ( failed ) *failed = failed_count;
	if ( total ) *total = count;

	return status;
}


xfer_status_t receive_entry(Connection* conn, Environment* env, const std::string& dest_dir)
{
	char name[XFER_NAME_BUF];
	char size_str[XFER_NAME_BUF];
	char parent_dir[MAX_PATH_LEN];
	char type;
	xfer_status_t status;

	// accepted
	if ( (status = send_signal(conn, SIGNAL_SUCCESS)) != XFER_OK ) {
		return status;
	}

	if ( (status = read_field(conn, name)) != XFER_OK ) {
		return status;
	}
	if ( !is_safe_name(name) ) {
		xfer_message(env, "Refusing to receive %s", name);
		send_signal(conn, SIGNAL_FAILURE);
		return XFER_REFUSED;
	}
	if ( (status = send_signal(conn, SIGNAL_SUCCESS)) != XFER_OK ) {
		return status;
	}

	if ( stream_read_fully(conn->get_in_fd(), &type, 1) != 1 ) {
		return XFER_CONNECTION_ENDED;
	}
	conn->add_received(1);

	std::string path = join_path(dest_dir, name);
	verb(VERB_2, "[%s] %s, type %d", __func__, path.c_str(), type);

	if ( type == ENTRY_DIR ) {
		if ( mkdir_parent(path.c_str()) != RET_SUCCESS ) {
			xfer_message(env, "Unable to create directory structure %s because a file exists with the same name as one of the directories.", path.c_str());
			status = send_signal(conn, SIGNAL_FAILURE);
			return status == XFER_OK ? XFER_ENTRY_FAILED : status;
		}
		return send_signal(conn, SIGNAL_SUCCESS);
	}

	if ( type != ENTRY_FILE ) {
		// the sender reads this as the size acknowledgement and gives up
		xfer_message(env, "Unknown entry type %d for %s", type, name);
		send_signal(conn, SIGNAL_FAILURE);
		return XFER_REFUSED;
	}

	if ( (status = read_field(conn, size_str)) != XFER_OK ) {
		return status;
	}
	char* end = NULL;
	errno = 0;
	long long parsed = strtoll(size_str, &end, 10);
	if ( errno || end == size_str || *end || parsed < CRYPTO_BLOCK_SIZE || parsed % CRYPTO_BLOCK_SIZE ) {
		xfer_message(env, "Bad size '%s' announced for %s", size_str, name);
		send_signal(conn, SIGNAL_FAILURE);
		return XFER_REFUSED;
	}
	off_t size = (off_t)parsed;
	if ( (status = send_signal(conn, SIGNAL_SUCCESS)) != XFER_OK ) {
		return status;
	}

	// destination: parents, room, a name nobody uses yet
	get_parent_dir(parent_dir, path.c_str());
	if ( mkdir_parent(parent_dir) != RET_SUCCESS ) {
		xfer_message(env, "Unable to create directory structure %s because a file exists with the same name as one of the directories.", parent_dir);
		status = send_signal(conn, SIGNAL_FAILURE);
		return status == XFER_OK ? XFER_ENTRY_FAILED : status;
	}
	if ( require_disk_space(parent_dir, size) != RET_SUCCESS ) {
		xfer_message(env, "Not enough disk space to receive %s", path.c_str());
		status = send_signal(conn, SIGNAL_FAILURE);
		return status == XFER_OK ? XFER_ENTRY_FAILED : status;
	}

	std::string final_path;
	if ( first_available(path.c_str(), final_path) != RET_SUCCESS ) {
		xfer_message(env, "No free name for %s", path.c_str());
		status = send_signal(conn, SIGNAL_FAILURE);
		return status == XFER_OK ? XFER_ENTRY_FAILED : status;
	}
	std::string part_path = final_path + PARTIAL_FILE_SUFFIX;

	int fd = open(part_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
	if ( fd < 0 ) {
		xfer_message(env, "Unable to create %s: %s", part_path.c_str(), strerror(errno));
		status = send_signal(conn, SIGNAL_FAILURE);
		return status == XFER_OK ? XFER_ENTRY_FAILED : status;
	}

	if ( (status = send_signal(conn, SIGNAL_SUCCESS)) != XFER_OK ) {
		close(fd);
		unlink(part_path.c_str());
		return status;
	}

	// shown relative to the destination, with the name actually used
	std::string shown = final_path.substr(join_path(dest_dir, "").size());
	std::string size_text = human_readable_byte_count(size);
	xfer_message(env, "Downloading %s (%s)", shown.c_str(), size_text.c_str());

	Crypto* dec = conn->get_decrypto();
	dec->reset();

	char cipher[XFER_CHUNK];
	char plain[XFER_CHUNK + CRYPTO_BLOCK_SIZE];
	off_t received = 0;
	int write_errno = 0;

	Progress progress(env, size, 1);
	if ( g_transfer_progress ) {
		progress.start();
	}

	while ( received < size ) {
		ssize_t rs = stream_read(conn->get_in_fd(), cipher, MIN((off_t)sizeof(cipher), size - received));
		if ( rs <= 0 ) {
			progress.stop();
			close(fd);
			unlink(part_path.c_str());
			dec->reset();
			xfer_message(env, "Connection ended while downloading %s", shown.c_str());
			return XFER_CONNECTION_ENDED;
		}
		conn->add_received(rs);
		received += rs;
		progress.add(rs);

		int out_len = dec->update(cipher, 0, rs, plain);
		if ( out_len < 0 ) {
			ERR("cipher update failed while receiving %s", shown.c_str());
		}
		// after a write error keep reading so the stream stays in step
		if ( !write_errno && out_len > 0 && stream_write_fully(fd, plain, out_len) != out_len ) {
			write_errno = errno ? errno : EIO;
		}
	}
	progress.stop();

	int out_len = dec->finalize(plain);
	if ( out_len == CRYPTO_ERR_BAD_PADDING ) {
		close(fd);
		unlink(part_path.c_str());
		xfer_message(env, "An error occured while downloading %s", final_path.c_str());
		xfer_message(env, "This is probably due to incorrect password.");
		status = send_signal(conn, SIGNAL_FAILURE);
		return status == XFER_OK ? XFER_BAD_PASSWORD : status;
	}
	if ( out_len < 0 ) {
		ERR("cipher finalize failed while receiving %s", shown.c_str());
	}
	if ( !write_errno && out_len > 0 && stream_write_fully(fd, plain, out_len) != out_len ) {
		write_errno = errno ? errno : EIO;
	}
	if ( close(fd) && !write_errno ) {
		write_errno = errno;
	}
	if ( !write_errno && rename(part_path.c_str(), final_path.c_str()) ) {
		write_errno = errno;
	}

	if ( write_errno ) {
		unlink(part_path.c_str());
		xfer_message(env, "An error occured while downloading %s: %s", final_path.c_str(), strerror(write_errno));
		status = send_signal(conn, SIGNAL_FAILURE);
		return status == XFER_OK ? XFER_ENTRY_FAILED : status;
	}

	if ( (status = send_signal(conn, SIGNAL_SUCCESS)) != XFER_OK ) {
		return status;
	}
	xfer_message(env, "Finished downloading %s (%s)", shown.c_str(), size_text.c_str());

	return XFER_OK;
}


xfer_status_t request_upload(Connection* conn, Environment* env, const char* path, const std::string& dest_dir)
{
	char buf[XFER_NAME_BUF];
	xfer_status_t status;
	HintScanner scanner;
	int failed = 0, received = 0;

	verb(VERB_2, "[%s] asking for %s", __func__, path);

	status = write_stream(conn, UPLOAD_KEYWORD, strlen(UPLOAD_KEYWORD));
	if ( status == XFER_OK ) {
		status = expect_success(conn);
	}
	if ( status == XFER_OK ) {
		status = write_stream(conn, path, strlen(path));
		if ( status == XFER_OK ) {
			status = expect_success(conn);
		}
		if ( status == XFER_REFUSED ) {
			xfer_message(env, "Peer is unable to send %s", path);
			return status;
		}
	}
	if ( status != XFER_OK ) {
		return status;
	}

	// entries until the peer says it is done
	while ( 1 ) {
		std::string text;
		ssize_t rs = stream_read(conn->get_in_fd(), buf, sizeof(buf));
		if ( rs <= 0 ) {
			xfer_message(env, "Connection ended while receiving %s", path);
			return XFER_CONNECTION_ENDED;
		}
		conn->add_received(rs);

		hint_t hint = scanner.scan(buf, rs, text);
		// input the peer forwarded before it saw our request
		conn->unread(text.data(), text.size());

		if ( hint == HINT_DOWNLOAD ) {
			xfer_status_t entry = receive_entry(conn, env, dest_dir);
			if ( entry == XFER_CONNECTION_ENDED ) {
				return entry;
			}
			received++;
			if ( entry != XFER_OK ) {
				failed++;
			}
		} else if ( hint == HINT_END ) {
			// lines the peer forwarded right after the end marker
			text.clear();
			scanner.flush(text);
			conn->unread(text.data(), text.size());
			break;
		} else if ( hint == HINT_UPLOAD ) {
			verb(VERB_1, "[%s] nested upload request ignored", __func__);
		}
	}

	if ( failed && received > 1 ) {
		xfer_message(env, "%d of %d entries failed", failed, received);
	}

	return failed ? XFER_ENTRY_FAILED : XFER_OK;
}


xfer_status_t serve_upload_request(Connection* conn, Environment* env)
{
	char path[XFER_NAME_BUF];
	std::string resolved;
	struct stat stats;
	xfer_status_t status;

	if ( (status = send_signal(conn, SIGNAL_SUCCESS)) != XFER_OK ) {
		return status;
	}
	if ( (status = read_field(conn, path)) != XFER_OK ) {
		return status;
	}

	const std::string cwd = env ? env->get_cwd() : "/";
	const marks_t no_marks;
	const marks_t& marks = env ? env->connection.get_marks() : no_marks;

	if ( resolve_path(cwd, marks, path, resolved) != RET_SUCCESS || stat(resolved.c_str(), &stats) ) {
		xfer_message(env, "Unable to find %s", path);
		status = send_signal(conn, SIGNAL_FAILURE);
		return status == XFER_OK ? XFER_REFUSED : status;
	}
	if ( (status = send_signal(conn, SIGNAL_SUCCESS)) != XFER_OK ) {
		return status;
	}

	status = send_path(conn, env, resolved.c_str(), NULL, NULL);
	if ( status == XFER_CONNECTION_ENDED ) {
		return status;
	}

	xfer_status_t end = write_stream(conn, TRANSFER_END_KEYWORD, strlen(TRANSFER_END_KEYWORD));
	return end == XFER_OK ? status : end;
}
