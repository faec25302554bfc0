/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being the AES-128-CBC stream cipher and password hash

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
#ifndef CRYPTO_H
#define CRYPTO_H

#define EVP_ENCRYPT 1
#define EVP_DECRYPT 0

// hex characters of the password hash consumed as key material
#define HASH_LEN            32
// full SHA-1 digest rendered as hex, plus terminator
#define HASH_HEX_BUFFER_LEN 41

#define CRYPTO_KEY_LEN      16
#define CRYPTO_BLOCK_SIZE   16

#define CRYPTO_ERR_INTERNAL     -1
#define CRYPTO_ERR_BAD_PADDING  -2

#include <sys/types.h>
#include <openssl/evp.h>

typedef unsigned char uchar;

//
// Crypto
//
// AES-128 in CBC mode with PKCS#7 padding, keyed by the first 16 bytes of a
// password hash. Key and IV are the same bytes, peers only need to agree on
// the password. One instance handles one direction; after finalize() it is
// ready to process the next file.
//
class Crypto
{
 private:
    EVP_CIPHER_CTX *ctx;
    uchar key[CRYPTO_KEY_LEN];
    uchar ivec[CRYPTO_KEY_LEN];
    int direction;

    Crypto(int direc, const uchar* key_bytes);

    Crypto(const Crypto&);
    Crypto& operator=(const Crypto&);

 public:
    // returns NULL if hash is shorter than HASH_LEN or not hex
    static Crypto* create(const char* hash, int direc);

    ~Crypto();

    // out must have room for len + CRYPTO_BLOCK_SIZE bytes, returns the
    // number of bytes written or CRYPTO_ERR_INTERNAL
    int update(const char* in, int offset, int len, char* out);

    // out must have room for CRYPTO_BLOCK_SIZE bytes, returns the number of
    // bytes written or CRYPTO_ERR_BAD_PADDING when decrypting with the wrong
    // key
    int finalize(char* out);

    int reset();

    int get_direction() const;

    // ciphertext length produced for a plaintext of plain_len bytes
    static off_t post_size(off_t plain_len);
};

// SHA-1 of password + salt as upper-case hex into out, which must hold
// HASH_HEX_BUFFER_LEN bytes
int generate_password_hash(const char* password, char* out);

#endif
