/*************************************************************************
 *   Copyright (c) 2026 - 2026 Yichao Yu <yyc1992@gmail.com>             *
 *                                                                       *
 *   This library is free software; you can redistribute it and/or       *
 *   modify it under the terms of the GNU Lesser General Public          *
 *   License as published by the Free Software Foundation; either        *
 *   version 3.0 of the License, or (at your option) any later version.  *
 *                                                                       *
 *   This library is distributed in the hope that it will be useful,     *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of      *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU    *
 *   Lesser General Public License for more details.                     *
 *                                                                       *
 *   You should have received a copy of the GNU Lesser General Public    *
 *   License along with this library. If not,                            *
 *   see <http://www.gnu.org/licenses/>.                                 *
 *************************************************************************/

#ifndef __AWGCTL_UTILS_DIGEST_H__
#define __AWGCTL_UTILS_DIGEST_H__

#include "utils.h"

#include <string>
#include <vector>

namespace AwgCtl {

/**
 * Incremental 64-bit FNV-1a content digest.
 *
 * Used to detect whether a serialized object changed between two calls.
 * This is not a cryptographic hash.
 */
class Digest {
public:
    static constexpr uint64_t offset_basis = 14695981039346656037ull;
    static constexpr uint64_t prime = 1099511628211ull;

    Digest &update(const void *data, size_t sz)
    {
        auto p = (const uint8_t*)data;
        for (size_t i = 0; i < sz; i++) {
            m_hash ^= p[i];
            m_hash *= prime;
        }
        return *this;
    }
    Digest &update(const std::vector<uint8_t> &data)
    {
        return update(data.data(), data.size());
    }
    uint64_t value() const
    {
        return m_hash;
    }

    static uint64_t compute(const void *data, size_t sz)
    {
        return Digest().update(data, sz).value();
    }

private:
    uint64_t m_hash = offset_basis;
};

// 16 lower case hex digits.
std::string digest_hex(uint64_t digest);

}

#endif
