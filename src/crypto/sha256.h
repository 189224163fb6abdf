// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DACHECK_CRYPTO_SHA256_H
#define DACHECK_CRYPTO_SHA256_H

#include <stdint.h>
#include <stdlib.h>

typedef struct evp_md_ctx_st EVP_MD_CTX;

/** A hasher class for SHA-256, backed by OpenSSL's libcrypto. */
class CSHA256
{
private:
    EVP_MD_CTX* ctx;

public:
    static const size_t OUTPUT_SIZE = 32;

    CSHA256();
    ~CSHA256();

    CSHA256(const CSHA256&) = delete;
    CSHA256& operator=(const CSHA256&) = delete;

    CSHA256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CSHA256& Reset();
};

#endif // DACHECK_CRYPTO_SHA256_H
