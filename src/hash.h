// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_HASH_H
#define ESCROWSWAP_HASH_H

#include "serialize.h"
#include "uint256.h"

#include <memory>
#include <stddef.h>

#include <openssl/evp.h>

/** A writer stream (for serialization) that computes a single SHA-256. */
class CHashWriter
{
private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx;

public:
    CHashWriter();

    CHashWriter(const CHashWriter&) = delete;
    CHashWriter& operator=(const CHashWriter&) = delete;

    void write(const char* pch, size_t size);

    /** Finalize and return the digest. The writer cannot be reused afterwards. */
    uint256 GetHash();

    template <typename T>
    CHashWriter& operator<<(const T& obj)
    {
        // Serialize to this stream
        ::Serialize(*this, obj);
        return (*this);
    }
};

/** Compute the SHA-256 hash of an object's canonical serialization. */
template <typename T>
uint256 SerializeHash(const T& obj)
{
    CHashWriter ss;
    ss << obj;
    return ss.GetHash();
}

#endif // ESCROWSWAP_HASH_H
