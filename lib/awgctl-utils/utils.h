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

#include "macros.h"

#ifndef __AWGCTL_UTILS_UTILS_H__
#define __AWGCTL_UTILS_UTILS_H__

#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include <chrono>
#include <string>
#include <type_traits>
#include <utility>

namespace AwgCtl {

/**
 * Tell the compiler that \param val is likely to be \param exp.
 */
template<typename T1, typename T2>
static AWGCTL_INLINE T1 expect(T1 val, T2 exp)
{
#if AWGCTL_CHECK_GCC_VERSION(3, 0)
    return __builtin_expect(val, exp);
#else
    (void)exp;
    return val;
#endif
}

/**
 * Tell the compiler that \param x is likely to be true.
 */
template<typename T>
static AWGCTL_INLINE bool likely(T x)
{
    return expect(bool(x), true);
}

/**
 * Tell the compiler that \param x is likely to be false.
 */
template<typename T>
static AWGCTL_INLINE bool unlikely(T x)
{
    return expect(bool(x), false);
}

// Run a callback when the scope is left unless it was dismissed first.
template<typename Func>
class ScopeExit {
    Func m_func;
    bool m_active = true;
    ScopeExit(const ScopeExit&) = delete;
    void operator=(const ScopeExit&) = delete;
public:
    ScopeExit(Func func)
        : m_func(std::move(func))
    {}
    ScopeExit(ScopeExit &&other)
        : m_func(std::move(other.m_func)),
          m_active(other.m_active)
    {
        other.m_active = false;
    }
    ~ScopeExit()
    {
        if (m_active) {
            m_func();
        }
    }
    void dismiss()
    {
        m_active = false;
    }
};

template<typename Func>
static inline auto make_scope_exit(Func &&func)
{
    return ScopeExit<std::decay_t<Func>>(std::forward<Func>(func));
}

// Append the bytes of a trivial object to a byte vector.
// Returns the offset the object was written at.
template<typename Vec, typename T>
static inline uint32_t write_bits(Vec &vec, T obj)
{
    static_assert(std::is_trivial_v<T>);
    auto len = (uint32_t)vec.size();
    vec.resize(len + sizeof(obj));
    memcpy(&vec[len], &obj, sizeof(obj));
    return len;
}

template<typename Vec>
static inline uint32_t write_bytes(Vec &vec, const void *src, size_t sz)
{
    auto len = (uint32_t)vec.size();
    vec.resize(len + sz);
    if (sz)
        memcpy(&vec[len], src, sz);
    return len;
}

// Monotonic time in nanoseconds.
static inline uint64_t getTime()
{
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

}

#endif
