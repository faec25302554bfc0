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
#include <openssl/evp.h>
#include <openssl/err.h>

#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <ctype.h>

#include "crypto.h"
#include "util.h"
#include "debug_output.h"

#define PASSWORD_SALT   "peaches.*"

static int hex_value(char c)
{
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}


Crypto::Crypto(int direc, const uchar* key_bytes)
{
	direction = direc;
	memcpy(key, key_bytes, CRYPTO_KEY_LEN);
	// the IV is the key, see generate_password_hash
	memcpy(ivec, key_bytes, CRYPTO_KEY_LEN);

	verb(VERB_3, "[%s] New crypto object, direc = %d", __func__, direc);

	const EVP_CIPHER *cipher = EVP_aes_128_cbc();
	if ( !cipher ) {
		ERR("AES-128-CBC is not available in this OpenSSL build");
	}

	ctx = EVP_CIPHER_CTX_new();
	if ( !ctx ) {
		ERR("unable to allocate cipher context");
	}

	if (!EVP_CipherInit_ex(ctx, cipher, NULL, key, ivec, direc)) {
		ERR("error setting encryption scheme: %s", ERR_error_string(ERR_get_error(), NULL));
	}
}

Crypto::~Crypto()
{
	if ( ctx ) {
		EVP_CIPHER_CTX_free(ctx);
		ctx = NULL;
	}
	OPENSSL_cleanse(key, sizeof(key));
	OPENSSL_cleanse(ivec, sizeof(ivec));
}

Crypto* Crypto::create(const char* hash, int direc)
{
	uchar key_bytes[CRYPTO_KEY_LEN];

	if ( !hash || strlen(hash) < HASH_LEN ) {
		warn("hash length must not be smaller than %d", HASH_LEN);
		return NULL;
	}

	for (int i = 0; i < CRYPTO_KEY_LEN; i++) {
		int hi = hex_value(hash[2*i]);
		int lo = hex_value(hash[2*i + 1]);
		if ( hi < 0 || lo < 0 ) {
			warn("hash is not a hex string");
			return NULL;
		}
		key_bytes[i] = (uchar)((hi << 4) | lo);
	}

	Crypto* c = new Crypto(direc, key_bytes);
	OPENSSL_cleanse(key_bytes, sizeof(key_bytes));
	return c;
}

int Crypto::get_direction() const
{
	return direction;
}

// Returns how much has been written to out, block chaining may hold back
// up to one block until the next call or finalize
int Crypto::update(const char* in, int offset, int len, char* out)
{
	int evp_outlen = 0;

	if ( len <= 0 ) {
		return 0;
	}

	if (!EVP_CipherUpdate(ctx, (uchar*)out, &evp_outlen, (const uchar*)in + offset, len)) {
		verb(VERB_2, "[%s] cipher update failed: %s", __func__, ERR_error_string(ERR_get_error(), NULL));
		return CRYPTO_ERR_INTERNAL;
	}

	return evp_outlen;
}

int Crypto::finalize(char* out)
{
	int evp_outlen = 0;
	int ret_val;

	if (!EVP_CipherFinal_ex(ctx, (uchar*)out, &evp_outlen)) {
		// in decrypt mode this is the padding check, the usual cause is a
		// peer that derived its key from another password
		ERR_clear_error();
		verb(VERB_3, "[%s] final block rejected", __func__);
		ret_val = (direction == EVP_DECRYPT) ? CRYPTO_ERR_BAD_PADDING : CRYPTO_ERR_INTERNAL;
	} else {
		ret_val = evp_outlen;
	}

	if ( reset() != RET_SUCCESS ) {
		return CRYPTO_ERR_INTERNAL;
	}

	return ret_val;
}

int Crypto::reset()
{
	// keep cipher and key, restart the chain from the IV
	if (!EVP_CipherInit_ex(ctx, NULL, NULL, key, ivec, direction)) {
		verb(VERB_2, "[%s] unable to reinitialize cipher", __func__);
		return RET_FAILURE;
	}
	return RET_SUCCESS;
}

off_t Crypto::post_size(off_t plain_len)
{
	return (plain_len / CRYPTO_BLOCK_SIZE + 1) * CRYPTO_BLOCK_SIZE;
}


//
// generate_password_hash
//
// SHA-1 over password + salt, rendered as upper-case hex. Both ends of a
// session run this on the password they were given, only the first HASH_LEN
// characters are used as key material
//
int generate_password_hash(const char* password, char* out)
{
	uchar digest[EVP_MAX_MD_SIZE];
	unsigned int digest_len = 0;
	static const char hex[] = "0123456789ABCDEF";

	if ( !password ) {
		password = "";
	}

	size_t pass_len = strlen(password);
	size_t salt_len = strlen(PASSWORD_SALT);
	char* salted = (char*)malloc(pass_len + salt_len + 1);
	if ( !salted ) {
		return RET_FAILURE;
	}
	memcpy(salted, password, pass_len);
	memcpy(salted + pass_len, PASSWORD_SALT, salt_len + 1);

	const EVP_MD* md = EVP_sha1();
	if ( !md ) {
		free(salted);
		ERR("SHA-1 is not available in this OpenSSL build");
	}

	int ok = EVP_Digest(salted, pass_len + salt_len, digest, &digest_len, md, NULL);
	OPENSSL_cleanse(salted, pass_len + salt_len);
	free(salted);

	if ( !ok || digest_len * 2 + 1 > HASH_HEX_BUFFER_LEN ) {
		verb(VERB_1, "[%s] unable to hash password", __func__);
		return RET_FAILURE;
	}

	for (unsigned int i = 0; i < digest_len; i++) {
		out[2*i]     = hex[digest[i] >> 4];
		out[2*i + 1] = hex[digest[i] & 0x0F];
	}
	out[digest_len * 2] = '\0';

	return RET_SUCCESS;
}
