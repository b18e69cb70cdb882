// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_UINT256_H
#define ESCROWSWAP_UINT256_H

#include <stdint.h>
#include <string.h>
#include <string>
#include <vector>

/**
 * 256-bit opaque blob.
 *
 * Used for parameter fingerprints and salts. Bytes are kept (and printed) in
 * digest order, so GetHex() matches the usual sha256sum rendering.
 */
class uint256
{
public:
    static const int WIDTH = 32;

protected:
    uint8_t data[WIDTH];

public:
    uint256() { SetNull(); }

    explicit uint256(const std::vector<unsigned char>& vch);

    bool IsNull() const
    {
        for (int i = 0; i < WIDTH; i++)
            if (data[i] != 0)
                return false;
        return true;
    }

    void SetNull() { memset(data, 0, sizeof(data)); }

    inline int Compare(const uint256& other) const { return memcmp(data, other.data, sizeof(data)); }

    friend inline bool operator==(const uint256& a, const uint256& b) { return a.Compare(b) == 0; }
    friend inline bool operator!=(const uint256& a, const uint256& b) { return a.Compare(b) != 0; }
    friend inline bool operator<(const uint256& a, const uint256& b) { return a.Compare(b) < 0; }

    std::string GetHex() const;
    void SetHex(const std::string& str);
    std::string ToString() const { return GetHex(); }

    unsigned char* begin() { return &data[0]; }
    unsigned char* end() { return &data[WIDTH]; }
    const unsigned char* begin() const { return &data[0]; }
    const unsigned char* end() const { return &data[WIDTH]; }

    unsigned int size() const { return sizeof(data); }

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        s.write((const char*)data, sizeof(data));
    }
};

/* uint256 from const char *.
 * This is a separate function because the constructor uint256(const char*) can result
 * in dangerously catching uint256(0).
 */
inline uint256 uint256S(const std::string& str)
{
    uint256 rv;
    rv.SetHex(str);
    return rv;
}

#endif // ESCROWSWAP_UINT256_H
