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

#ifndef __AWGCTL_UTILS_MACROS_H__
#define __AWGCTL_UTILS_MACROS_H__

/**
 * \file macros.h
 * \brief Definitions of some useful macros.
 */

#define AWGCTL_OS_LINUX 0
#define AWGCTL_OS_WINDOWS 0
#define AWGCTL_OS_DARWIN 0

#if defined(__linux__)
#  undef AWGCTL_OS_LINUX
#  define AWGCTL_OS_LINUX 1
#elif defined(_WIN32) || defined(_WIN64)
#  undef AWGCTL_OS_WINDOWS
#  define AWGCTL_OS_WINDOWS 1
#elif defined(__APPLE__) && defined(__MACH__)
#  undef AWGCTL_OS_DARWIN
#  define AWGCTL_OS_DARWIN 1
#endif

#ifdef __GNUC__
#  define AWGCTL_GCC_VERSION                                            \
    ((__GNUC__) << 16 | (__GNUC_MINOR__) << 8 | (__GNUC_PATCHLEVEL__))
#else
#  define AWGCTL_GCC_VERSION 0
#endif
#define AWGCTL_CHECK_GCC_VERSION(a, b)                  \
    (AWGCTL_GCC_VERSION >= ((a) << 16 | (b) << 8))

/**
 * \brief always inline the function.
 *
 * Should only be used for small functions
 */
#define AWGCTL_INLINE __attribute__((always_inline)) inline
#define AWGCTL_NOINLINE __attribute__((noinline))

/**
 * \brief Export symbol.
 */
#if AWGCTL_OS_WINDOWS
#  define AWGCTL_EXPORT(...) __declspec(dllexport)
#  define AWGCTL_INTERNAL
#else
#  define AWGCTL_EXPORT(...) __attribute__((visibility("default")))
#  define AWGCTL_INTERNAL __attribute__((visibility("internal")))
#endif

/**
 * Suppress unused parameter warning on variable \param x.
 */
#define AWGCTL_UNUSED __attribute__((unused))

#ifdef __GNUC__
#  define AWGCTL_NORETURN __attribute__((noreturn))
#else
#  define AWGCTL_NORETURN
#endif

#define AWGCTL_RET_IF_FAIL(exp, ...) do {               \
        if (!AwgCtl::likely(exp)) {                     \
            return __VA_ARGS__;                         \
        }                                               \
    } while (0)

#endif
