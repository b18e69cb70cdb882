// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_SERIALIZE_H
#define ESCROWSWAP_SERIALIZE_H

/**
 * Canonical serialization
 *
 * Escrow terms are never read back from bytes: the serialized form exists only
 * to be hashed into the parameter fingerprint. Encoding rules:
 * - integers little-endian, fixed width
 * - strings and containers prefixed with a CompactSize length
 * - ordered containers (std::set / std::map) in iteration order
 * - Optional<T> as a 0/1 byte followed by the value when present
 */

#include "optional.h"

#include <map>
#include <set>
#include <stdint.h>
#include <string>
#include <vector>

/*
 * Lowest-level serialization and conversion.
 */
template <typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj)
{
    s.write((char*)&obj, 1);
}
template <typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj)
{
    unsigned char buf[4];
    for (int i = 0; i < 4; i++)
        buf[i] = (unsigned char)(obj >> (8 * i));
    s.write((char*)buf, 4);
}
template <typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj)
{
    unsigned char buf[8];
    for (int i = 0; i < 8; i++)
        buf[i] = (unsigned char)(obj >> (8 * i));
    s.write((char*)buf, 8);
}

/**
 * Compact Size
 * size <  253        -- 1 byte
 * size <= USHRT_MAX  -- 3 bytes  (253 + 2 bytes)
 * size <= UINT_MAX   -- 5 bytes  (254 + 4 bytes)
 * size >  UINT_MAX   -- 9 bytes  (255 + 8 bytes)
 */
template <typename Stream>
void WriteCompactSize(Stream& os, uint64_t nSize)
{
    if (nSize < 253) {
        ser_writedata8(os, nSize);
    } else if (nSize <= 0xffff) {
        ser_writedata8(os, 253);
        unsigned char buf[2] = {(unsigned char)nSize, (unsigned char)(nSize >> 8)};
        os.write((char*)buf, 2);
    } else if (nSize <= 0xffffffffu) {
        ser_writedata8(os, 254);
        ser_writedata32(os, nSize);
    } else {
        ser_writedata8(os, 255);
        ser_writedata64(os, nSize);
    }
}

// clang-format off
template<typename Stream> inline void Serialize(Stream& s, char a    ) { ser_writedata8(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint8_t a ) { ser_writedata8(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }
template<typename Stream> inline void Serialize(Stream& s, int64_t a ) { ser_writedata64(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }
template<typename Stream> inline void Serialize(Stream& s, bool a    ) { char f = a; ser_writedata8(s, f); }
// clang-format on

/**
 * Forward declarations
 */

template <typename Stream>
void Serialize(Stream& os, const std::string& str);

template <typename Stream, typename T>
void Serialize(Stream& os, const std::vector<T>& v);

template <typename Stream, typename K, typename Pred>
void Serialize(Stream& os, const std::set<K, Pred>& m);

template <typename Stream, typename K, typename T, typename Pred>
void Serialize(Stream& os, const std::map<K, T, Pred>& m);

template <typename Stream, typename T>
void Serialize(Stream& os, const boost::optional<T>& item);

/**
 * If none of the specialized versions above matched, default to calling member function.
 */
template <typename Stream, typename T>
inline void Serialize(Stream& os, const T& a)
{
    a.Serialize(os);
}

template <typename Stream>
void Serialize(Stream& os, const std::string& str)
{
    WriteCompactSize(os, str.size());
    if (!str.empty())
        os.write(str.data(), str.size());
}

template <typename Stream, typename T>
void Serialize(Stream& os, const std::vector<T>& v)
{
    WriteCompactSize(os, v.size());
    for (typename std::vector<T>::const_iterator vi = v.begin(); vi != v.end(); ++vi)
        Serialize(os, (*vi));
}

template <typename Stream, typename K, typename Pred>
void Serialize(Stream& os, const std::set<K, Pred>& m)
{
    WriteCompactSize(os, m.size());
    for (typename std::set<K, Pred>::const_iterator it = m.begin(); it != m.end(); ++it)
        Serialize(os, (*it));
}

template <typename Stream, typename K, typename T, typename Pred>
void Serialize(Stream& os, const std::map<K, T, Pred>& m)
{
    WriteCompactSize(os, m.size());
    for (typename std::map<K, T, Pred>::const_iterator mi = m.begin(); mi != m.end(); ++mi) {
        Serialize(os, mi->first);
        Serialize(os, mi->second);
    }
}

template <typename Stream, typename T>
void Serialize(Stream& os, const boost::optional<T>& item)
{
    // If the value is there, put 1, else 0
    if (item) {
        ser_writedata8(os, 1);
        Serialize(os, *item);
    } else {
        ser_writedata8(os, 0);
    }
}

template <typename Stream>
void SerializeMany(Stream& s)
{
}

template <typename Stream, typename Arg, typename... Args>
void SerializeMany(Stream& s, const Arg& arg, const Args&... args)
{
    Serialize(s, arg);
    SerializeMany(s, args...);
}

#define READWRITE(...) (SerializeMany(s, __VA_ARGS__))

/**
 * Implement the Serialize method for a type by listing its fields once:
 *
 *   SERIALIZE_METHODS(EscrowParams, obj) { READWRITE(obj.maker, obj.price); }
 */
#define SERIALIZE_METHODS(cls, obj)                         \
    template <typename Stream>                              \
    void Serialize(Stream& s) const                         \
    {                                                       \
        SerializationOps(*this, s);                         \
    }                                                       \
    template <typename Stream>                              \
    static void SerializationOps(const cls& obj, Stream& s)

#endif // ESCROWSWAP_SERIALIZE_H
