// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "uint256.h"

#include "utilstrencodings.h"

#include <algorithm>

uint256::uint256(const std::vector<unsigned char>& vch)
{
    SetNull();
    if (vch.size() == sizeof(data)) {
        memcpy(data, vch.data(), sizeof(data));
    }
}

std::string uint256::GetHex() const
{
    return HexStr(begin(), end());
}

void uint256::SetHex(const std::string& str)
{
    SetNull();

    // skip 0x
    size_t pos = 0;
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        pos = 2;
    }

    // Left-aligned: "ab" sets the first byte, remaining bytes stay zero
    std::vector<unsigned char> vch = ParseHex(str.substr(pos));
    size_t n = std::min(vch.size(), sizeof(data));
    if (n > 0) {
        memcpy(data, vch.data(), n);
    }
}
