// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.h"

#include <stdexcept>

CHashWriter::CHashWriter() : ctx(EVP_MD_CTX_new())
{
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("CHashWriter: SHA-256 context initialization failed");
    }
}

void CHashWriter::write(const char* pch, size_t size)
{
    if (EVP_DigestUpdate(ctx.get(), pch, size) != 1) {
        throw std::runtime_error("CHashWriter: SHA-256 update failed");
    }
}

uint256 CHashWriter::GetHash()
{
    std::vector<unsigned char> digest(uint256::WIDTH);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 || len != (unsigned int)uint256::WIDTH) {
        throw std::runtime_error("CHashWriter: SHA-256 finalization failed");
    }
    return uint256(digest);
}
