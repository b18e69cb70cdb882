// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_UTIL_FORMAT_H
#define ESCROWSWAP_UTIL_FORMAT_H

#include <string>

#include <tinyformat.h>

/** Format arguments and return the string (printf-style, type safe). */
template <typename... Args>
std::string strprintf(const char* fmt, const Args&... args)
{
    return tfm::format(fmt, args...);
}

#endif // ESCROWSWAP_UTIL_FORMAT_H
