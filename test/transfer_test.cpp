/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being tests of the entry protocol over a
    socket pair

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
#include <poll.h>
#include <pthread.h>
#include <string.h>
#include <unistd.h>
#include <sys/socket.h>

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "connection.h"
#include "crypto.h"
#include "hint.h"
#include "network.h"
#include "transfer.h"
#include "util.h"
#include "test_helpers.h"

static Crypto* make_crypto(const char* password, int direc)
{
    char hash[HASH_HEX_BUFFER_LEN];
    if ( generate_password_hash(password, hash) ) {
        return NULL;
    }
    return Crypto::create(hash, direc);
}

// reads markers off conn and receives entries until the peer hangs up
static int receive_all(Connection* conn, const std::string& dest, std::vector<xfer_status_t>& statuses)
{
    HintScanner scanner;
    char buf[XFER_NAME_BUF];

    while ( 1 ) {
        std::string text;
        ssize_t rs = stream_read(conn->get_in_fd(), buf, sizeof(buf));
        if ( rs <= 0 ) {
            break;
        }
        conn->add_received(rs);
        if ( scanner.scan(buf, rs, text) == HINT_DOWNLOAD ) {
            xfer_status_t status = receive_entry(conn, NULL, dest);
            statuses.push_back(status);
            if ( status == XFER_CONNECTION_ENDED ) {
                break;
            }
        }
    }
    return statuses.size();
}

// writes s and expects one signal back
static int step(int fd, const std::string& s)
{
    char signal = -1;
    if ( !s.empty() && stream_write_fully(fd, s.data(), s.size()) != (ssize_t)s.size() ) {
        return -1;
    }
    if ( stream_read_fully(fd, &signal, 1) != 1 ) {
        return -1;
    }
    return signal;
}

static std::string encrypt(const char* password, const std::string& plain)
{
    Crypto* enc = make_crypto(password, EVP_ENCRYPT);
    std::vector<char> out(plain.size() + CRYPTO_BLOCK_SIZE);
    std::string cipher;

    int n = enc->update(plain.data(), 0, plain.size(), &out[0]);
    cipher.append(&out[0], n);
    n = enc->finalize(&out[0]);
    cipher.append(&out[0], n);
    delete enc;
    return cipher;
}


class TransferTest : public ::testing::Test
{
 protected:
    int sv[2];
    Connection sender;
    Connection receiver;
    Crypto* ciphers[4];
    TempDir src;
    TempDir dest;

    virtual void SetUp()
    {
        set_transfer_progress(0);
        ASSERT_EQ(0, socketpair(AF_UNIX, SOCK_STREAM, 0, sv));
        memset(ciphers, 0, sizeof(ciphers));
    }

    virtual void TearDown()
    {
        close_end(0);
        close_end(1);
        for ( int i = 0; i < 4; i++ ) {
            delete ciphers[i];
        }
    }

    void connect(const char* send_password, const char* receive_password)
    {
        ciphers[0] = make_crypto(send_password, EVP_ENCRYPT);
        ciphers[1] = make_crypto(send_password, EVP_DECRYPT);
        ciphers[2] = make_crypto(receive_password, EVP_ENCRYPT);
        ciphers[3] = make_crypto(receive_password, EVP_DECRYPT);
        sender.connect_streams(sv[0], sv[0], ciphers[0], ciphers[1]);
        receiver.connect_streams(sv[1], sv[1], ciphers[2], ciphers[3]);
    }

    void close_end(int i)
    {
        if ( sv[i] >= 0 ) {
            close(sv[i]);
            sv[i] = -1;
        }
    }
};


struct send_job_t {
    Connection* conn;
    std::string path;
    int sock;
    int failed;
    int total;
    xfer_status_t status;
};

static void* send_path_thread(void* arg)
{
    send_job_t* job = (send_job_t*)arg;
    job->status = send_path(job->conn, NULL, job->path.c_str(), &job->failed, &job->total);
    // the receiver loop stops at end of stream
    shutdown(job->sock, SHUT_WR);
    return NULL;
}

struct receive_job_t {
    Connection* conn;
    std::string dest;
    xfer_status_t status;
};

static void* receive_entry_thread(void* arg)
{
    receive_job_t* job = (receive_job_t*)arg;
    job->status = receive_entry(job->conn, NULL, job->dest);
    return NULL;
}


TEST_F(TransferTest, DirectoryTreeArrivesIntact)
{
    connect("secret", "secret");

    std::string top = src.sub("d");
    ASSERT_EQ(RET_SUCCESS, mkdir_parent((top + "/sub/empty").c_str()));
    write_file(top + "/a.txt", "alpha");
    write_file(top + "/sub/b.bin", pattern(70000));
    write_file(top + "/sub/zero", "");

    send_job_t job = { &sender, top, sv[0], 0, 0, XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, send_path_thread, &job));

    std::vector<xfer_status_t> statuses;
    receive_all(&receiver, dest.str(), statuses);
    pthread_join(thread, NULL);

    EXPECT_EQ(XFER_OK, job.status);
    EXPECT_EQ(0, job.failed);
    EXPECT_EQ(6, job.total);
    ASSERT_EQ(6u, statuses.size());
    for ( size_t i = 0; i < statuses.size(); i++ ) {
        EXPECT_EQ(XFER_OK, statuses[i]) << i;
    }

    EXPECT_EQ("alpha", read_file(dest.sub("d/a.txt")));
    EXPECT_TRUE(read_file(dest.sub("d/sub/b.bin")) == pattern(70000));
    EXPECT_TRUE(exists(dest.sub("d/sub/zero")));
    EXPECT_EQ("", read_file(dest.sub("d/sub/zero")));
    EXPECT_TRUE(is_dir(dest.sub("d/sub/empty")));
    EXPECT_FALSE(exists(dest.sub("d/a.txt.part")));

    // each side counts what the other did
    EXPECT_EQ(sender.get_bytes_sent(), receiver.get_bytes_received());
    EXPECT_EQ(receiver.get_bytes_sent(), sender.get_bytes_received());
}

TEST_F(TransferTest, ExistingNameIsNotOverwritten)
{
    connect("secret", "secret");

    write_file(src.sub("notes.txt"), "new");
    write_file(dest.sub("notes.txt"), "old");

    send_job_t job = { &sender, src.sub("notes.txt"), sv[0], 0, 0, XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, send_path_thread, &job));

    std::vector<xfer_status_t> statuses;
    receive_all(&receiver, dest.str(), statuses);
    pthread_join(thread, NULL);

    EXPECT_EQ(XFER_OK, job.status);
    EXPECT_EQ("old", read_file(dest.sub("notes.txt")));
    EXPECT_EQ("new", read_file(dest.sub("notes-0.txt")));
}

// the receiver reads content however the sender slices it
class ChunkedContentTest : public TransferTest, public ::testing::WithParamInterface<size_t>
{
};

TEST_P(ChunkedContentTest, ReceivesEveryByte)
{
    connect("secret", "secret");

    std::string plain = pattern(10000, 3);
    std::string cipher = encrypt("secret", plain);
    size_t chunk = GetParam() ? GetParam() : cipher.size();
    char size_str[32];
    snprintf(size_str, sizeof(size_str), "%zu", cipher.size());

    receive_job_t job = { &receiver, dest.str(), XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, receive_entry_thread, &job));

    int fd = sv[0];
    EXPECT_EQ(SIGNAL_SUCCESS, step(fd, ""));                  // accepted
    EXPECT_EQ(SIGNAL_SUCCESS, step(fd, "in/chunked.bin"));    // name
    char type = ENTRY_FILE;
    ASSERT_EQ(1, stream_write_fully(fd, &type, 1));
    EXPECT_EQ(SIGNAL_SUCCESS, step(fd, size_str));            // size
    EXPECT_EQ(SIGNAL_SUCCESS, step(fd, ""));                  // ready

    for ( size_t pos = 0; pos < cipher.size(); pos += chunk ) {
        size_t len = std::min(chunk, cipher.size() - pos);
        ASSERT_EQ((ssize_t)len, stream_write_fully(fd, cipher.data() + pos, len));
    }
    EXPECT_EQ(SIGNAL_SUCCESS, step(fd, ""));                  // done

    pthread_join(thread, NULL);
    EXPECT_EQ(XFER_OK, job.status);
    EXPECT_TRUE(read_file(dest.sub("in/chunked.bin")) == plain);
}

INSTANTIATE_TEST_SUITE_P(Slices, ChunkedContentTest, ::testing::Values(1, 7, 1024, 0));

TEST_F(TransferTest, SenderWaitsForEachSignal)
{
    connect("secret", "secret");
    write_file(src.sub("held.txt"), "held");

    send_job_t job = { &sender, src.sub("held.txt"), sv[0], 0, 0, XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, send_path_thread, &job));

    char marker[64];
    size_t marker_len = strlen(DOWNLOAD_KEYWORD);
    ASSERT_EQ((ssize_t)marker_len, stream_read_fully(sv[1], marker, marker_len));
    EXPECT_EQ(0, memcmp(marker, DOWNLOAD_KEYWORD, marker_len));

    // without the accept signal nothing else is written
    struct pollfd pfd = { sv[1], POLLIN, 0 };
    EXPECT_EQ(0, poll(&pfd, 1, 200));
    EXPECT_EQ(XFER_STATE_AWAIT_ACCEPT, sender.get_send_state());

    close_end(1);
    pthread_join(thread, NULL);

    EXPECT_EQ(XFER_CONNECTION_ENDED, job.status);
    EXPECT_EQ(XFER_STATE_IDLE, sender.get_send_state());
}

TEST_F(TransferTest, FailedEntryDoesNotStopTheWalk)
{
    connect("secret", "secret");

    std::string top = src.sub("d");
    ASSERT_EQ(RET_SUCCESS, mkdir_parent(top.c_str()));
    write_file(top + "/a.txt", "aaa");
    write_file(top + "/b.txt", "bbb");
    write_file(top + "/c.txt", "ccc");

    // the partial file for b can't be created
    ASSERT_EQ(RET_SUCCESS, mkdir_parent(dest.sub("d/b.txt.part").c_str()));

    send_job_t job = { &sender, top, sv[0], 0, 0, XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, send_path_thread, &job));

    std::vector<xfer_status_t> statuses;
    receive_all(&receiver, dest.str(), statuses);
    pthread_join(thread, NULL);

    EXPECT_EQ(XFER_ENTRY_FAILED, job.status);
    EXPECT_EQ(1, job.failed);
    EXPECT_EQ(4, job.total);

    EXPECT_EQ("aaa", read_file(dest.sub("d/a.txt")));
    EXPECT_FALSE(exists(dest.sub("d/b.txt")));
    EXPECT_EQ("ccc", read_file(dest.sub("d/c.txt")));
}

TEST_F(TransferTest, DisconnectAfterNameLeavesNothing)
{
    connect("secret", "secret");

    receive_job_t job = { &receiver, dest.str(), XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, receive_entry_thread, &job));

    EXPECT_EQ(SIGNAL_SUCCESS, step(sv[0], ""));
    EXPECT_EQ(SIGNAL_SUCCESS, step(sv[0], "gone.txt"));
    close_end(0);

    pthread_join(thread, NULL);
    EXPECT_EQ(XFER_CONNECTION_ENDED, job.status);
    EXPECT_FALSE(exists(dest.sub("gone.txt")));
    EXPECT_FALSE(exists(dest.sub("gone.txt.part")));
}

TEST_F(TransferTest, DisconnectDuringContentRemovesPartialFile)
{
    connect("secret", "secret");
    std::string cipher = encrypt("secret", pattern(4000));
    char size_str[32];
    snprintf(size_str, sizeof(size_str), "%zu", cipher.size());

    receive_job_t job = { &receiver, dest.str(), XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, receive_entry_thread, &job));

    int fd = sv[0];
    EXPECT_EQ(SIGNAL_SUCCESS, step(fd, ""));
    EXPECT_EQ(SIGNAL_SUCCESS, step(fd, "cut.bin"));
    char type = ENTRY_FILE;
    ASSERT_EQ(1, stream_write_fully(fd, &type, 1));
    EXPECT_EQ(SIGNAL_SUCCESS, step(fd, size_str));
    EXPECT_EQ(SIGNAL_SUCCESS, step(fd, ""));
    ASSERT_EQ(1000, stream_write_fully(fd, cipher.data(), 1000));
    close_end(0);

    pthread_join(thread, NULL);
    EXPECT_EQ(XFER_CONNECTION_ENDED, job.status);
    EXPECT_FALSE(exists(dest.sub("cut.bin")));
    EXPECT_FALSE(exists(dest.sub("cut.bin.part")));
}

TEST_F(TransferTest, WrongPasswordLeavesNoFile)
{
    connect("wrong", "secret");
    write_file(src.sub("x.txt"), std::string(5000, 'x'));

    send_job_t job = { &sender, src.sub("x.txt"), sv[0], 0, 0, XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, send_path_thread, &job));

    std::vector<xfer_status_t> statuses;
    receive_all(&receiver, dest.str(), statuses);
    pthread_join(thread, NULL);

    ASSERT_EQ(1u, statuses.size());
    EXPECT_EQ(XFER_BAD_PASSWORD, statuses[0]);
    EXPECT_EQ(XFER_ENTRY_FAILED, job.status);
    EXPECT_FALSE(exists(dest.sub("x.txt")));
    EXPECT_FALSE(exists(dest.sub("x.txt.part")));
}

TEST_F(TransferTest, FileShrinkingMidSendIsNotStored)
{
    connect("secret", "secret");
    std::string path = src.sub("shrinks.txt");
    write_file(path, pattern(40, 4));

    send_job_t job = { &sender, path, sv[0], 0, 0, XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, send_path_thread, &job));

    // answer the sender by hand up to the ready step
    int fd = sv[1];
    char buf[XFER_NAME_BUF];
    size_t marker_len = strlen(DOWNLOAD_KEYWORD);
    ASSERT_EQ((ssize_t)marker_len, stream_read_fully(fd, buf, marker_len));
    char signal = SIGNAL_SUCCESS;
    ASSERT_EQ(1, stream_write_fully(fd, &signal, 1));

    ssize_t rs = stream_read(fd, buf, sizeof(buf));
    ASSERT_GT(rs, 0);
    EXPECT_EQ("shrinks.txt", std::string(buf, rs));
    ASSERT_EQ(1, stream_write_fully(fd, &signal, 1));

    char type = -1;
    ASSERT_EQ(1, stream_read_fully(fd, &type, 1));
    EXPECT_EQ(ENTRY_FILE, type);
    rs = stream_read(fd, buf, sizeof(buf) - 1);
    ASSERT_GT(rs, 0);
    buf[rs] = '\0';
    EXPECT_STREQ("48", buf);
    ASSERT_EQ(1, stream_write_fully(fd, &signal, 1));

    // the size is already announced when the file loses most of its bytes
    ASSERT_EQ(0, truncate(path.c_str(), 10));
    ASSERT_EQ(1, stream_write_fully(fd, &signal, 1));

    char cipher[48];
    ASSERT_EQ(48, stream_read_fully(fd, cipher, sizeof(cipher)));

    Crypto* dec = make_crypto("secret", EVP_DECRYPT);
    ASSERT_TRUE(dec != NULL);
    char plain[sizeof(cipher) + CRYPTO_BLOCK_SIZE];
    EXPECT_EQ(32, dec->update(cipher, 0, sizeof(cipher), plain));
    EXPECT_EQ(CRYPTO_ERR_BAD_PADDING, dec->finalize(plain));
    delete dec;

    signal = SIGNAL_FAILURE;
    ASSERT_EQ(1, stream_write_fully(fd, &signal, 1));
    pthread_join(thread, NULL);

    EXPECT_EQ(XFER_ENTRY_FAILED, job.status);
    EXPECT_EQ(1, job.failed);

    // the same bytes handed to a real receiver leave nothing behind
    close_end(0);
    close_end(1);
    ASSERT_EQ(0, socketpair(AF_UNIX, SOCK_STREAM, 0, sv));
    receiver.connect_streams(sv[1], sv[1], ciphers[2], ciphers[3]);

    receive_job_t receive = { &receiver, dest.str(), XFER_OK };
    ASSERT_EQ(0, pthread_create(&thread, NULL, receive_entry_thread, &receive));

    EXPECT_EQ(SIGNAL_SUCCESS, step(sv[0], ""));
    EXPECT_EQ(SIGNAL_SUCCESS, step(sv[0], "shrinks.txt"));
    type = ENTRY_FILE;
    ASSERT_EQ(1, stream_write_fully(sv[0], &type, 1));
    EXPECT_EQ(SIGNAL_SUCCESS, step(sv[0], "48"));
    EXPECT_EQ(SIGNAL_SUCCESS, step(sv[0], ""));
    EXPECT_EQ(SIGNAL_FAILURE, step(sv[0], std::string(cipher, sizeof(cipher))));

    pthread_join(thread, NULL);
    EXPECT_NE(XFER_OK, receive.status);
    EXPECT_FALSE(exists(dest.sub("shrinks.txt")));
    EXPECT_FALSE(exists(dest.sub("shrinks.txt.part")));
}

TEST_F(TransferTest, UnsafeNamesAreRefused)
{
    const char* names[] = { "../escape.txt", "/etc/passwd", "a//b", "a/../../b" };

    connect("secret", "secret");

    for ( size_t i = 0; i < sizeof(names) / sizeof(names[0]); i++ ) {
        receive_job_t job = { &receiver, dest.str(), XFER_OK };
        pthread_t thread;
        ASSERT_EQ(0, pthread_create(&thread, NULL, receive_entry_thread, &job));

        EXPECT_EQ(SIGNAL_SUCCESS, step(sv[0], ""));
        EXPECT_EQ(SIGNAL_FAILURE, step(sv[0], names[i])) << names[i];

        pthread_join(thread, NULL);
        EXPECT_EQ(XFER_REFUSED, job.status) << names[i];
    }
}

TEST_F(TransferTest, SizeMustBeWholeBlocks)
{
    connect("secret", "secret");

    receive_job_t job = { &receiver, dest.str(), XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, receive_entry_thread, &job));

    EXPECT_EQ(SIGNAL_SUCCESS, step(sv[0], ""));
    EXPECT_EQ(SIGNAL_SUCCESS, step(sv[0], "odd.bin"));
    char type = ENTRY_FILE;
    ASSERT_EQ(1, stream_write_fully(sv[0], &type, 1));
    EXPECT_EQ(SIGNAL_FAILURE, step(sv[0], "17"));

    pthread_join(thread, NULL);
    EXPECT_EQ(XFER_REFUSED, job.status);
    EXPECT_FALSE(exists(dest.sub("odd.bin.part")));
}

TEST_F(TransferTest, StrayInputBeforeSignalIsKept)
{
    connect("secret", "secret");

    const char data[] = { 'l', 's', '\n', SIGNAL_SUCCESS };
    ASSERT_EQ((ssize_t)sizeof(data), stream_write_fully(sv[1], data, sizeof(data)));

    int signal = -1;
    ASSERT_EQ(XFER_OK, wait_for_signal(&sender, &signal));
    EXPECT_EQ(SIGNAL_SUCCESS, signal);

    std::string pending;
    EXPECT_EQ(3, sender.take_pending(pending));
    EXPECT_EQ("ls\n", pending);
}


struct serve_job_t {
    Connection* conn;
    xfer_status_t status;
};

// the peer side of an upload request: marker, then serve
static void* serve_thread(void* arg)
{
    serve_job_t* job = (serve_job_t*)arg;
    char buf[XFER_NAME_BUF];
    HintScanner scanner;
    std::string text;

    job->status = XFER_CONNECTION_ENDED;
    while ( 1 ) {
        ssize_t rs = stream_read(job->conn->get_in_fd(), buf, sizeof(buf));
        if ( rs <= 0 ) {
            return NULL;
        }
        job->conn->add_received(rs);
        if ( scanner.scan(buf, rs, text) == HINT_UPLOAD ) {
            job->status = serve_upload_request(job->conn, NULL);
            return NULL;
        }
    }
}

TEST_F(TransferTest, UploadRequestPullsTree)
{
    connect("secret", "secret");

    std::string top = src.sub("pics");
    ASSERT_EQ(RET_SUCCESS, mkdir_parent(top.c_str()));
    write_file(top + "/one.jpg", pattern(3000, 1));
    write_file(top + "/two.jpg", pattern(5000, 2));

    serve_job_t job = { &sender, XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, serve_thread, &job));

    // no environment on the serving side, so the path is absolute
    EXPECT_EQ(XFER_OK, request_upload(&receiver, NULL, top.c_str(), dest.str()));
    pthread_join(thread, NULL);

    EXPECT_EQ(XFER_OK, job.status);
    EXPECT_TRUE(read_file(dest.sub("pics/one.jpg")) == pattern(3000, 1));
    EXPECT_TRUE(read_file(dest.sub("pics/two.jpg")) == pattern(5000, 2));
}

TEST_F(TransferTest, UploadRequestForMissingPathIsRefused)
{
    connect("secret", "secret");

    serve_job_t job = { &sender, XFER_OK };
    pthread_t thread;
    ASSERT_EQ(0, pthread_create(&thread, NULL, serve_thread, &job));

    EXPECT_EQ(XFER_REFUSED, request_upload(&receiver, NULL, src.sub("nothing").c_str(), dest.str()));
    pthread_join(thread, NULL);

    EXPECT_EQ(XFER_REFUSED, job.status);
}
