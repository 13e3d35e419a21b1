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

#ifndef __AWGCTL_UTILS_LOG_H__
#define __AWGCTL_UTILS_LOG_H__

#include "utils.h"

#include <functional>

#include <stdarg.h>

namespace AwgCtl {
namespace Log {

enum Level {
    Debug,
    Info,
    Warn,
    Error,
    Force
};

extern Level level;

static AWGCTL_INLINE bool checkLevel(unsigned _level)
{
    return AwgCtl::unlikely(_level <= Force && _level >= level);
}

// Logger callbacks replace the default stderr output for the current thread.
// The message passed in is fully formatted.
using cb_t = std::function<void(Level, const char *func, const char *msg)>;
void pushLogger(cb_t cb);
void popLogger();

bool printPID();
void printPID(bool b);

__attribute__((format(printf, 3, 4)))
void _log(Level level, const char *func, const char *fmt, ...);

__attribute__((format(printf, 3, 0)))
void _logV(Level level, const char *func, const char *fmt, va_list ap);

__attribute__((format(printf, 1, 2))) void info(const char *fmt, ...);
__attribute__((format(printf, 1, 2))) void warn(const char *fmt, ...);
__attribute__((format(printf, 1, 2))) void error(const char *fmt, ...);
__attribute__((format(printf, 1, 2))) void log(const char *fmt, ...);

} // Log
} // AwgCtl

#define __awgLog(__level, fmt, ...)                                     \
    do {                                                                \
        auto level = (AwgCtl::Log::Level)(__level);                     \
        if (!AwgCtl::Log::checkLevel(level))                            \
            break;                                                      \
        AwgCtl::Log::_log(level, __FUNCTION__, fmt, ##__VA_ARGS__);     \
    } while (0)

#define awgDebug(fmt, ...)                              \
    __awgLog(AwgCtl::Log::Debug, fmt, ##__VA_ARGS__)
#define awgInfo(fmt, ...)                               \
    __awgLog(AwgCtl::Log::Info, fmt, ##__VA_ARGS__)
#define awgWarn(fmt, ...)                               \
    __awgLog(AwgCtl::Log::Warn, fmt, ##__VA_ARGS__)
#define awgError(fmt, ...)                              \
    __awgLog(AwgCtl::Log::Error, fmt, ##__VA_ARGS__)
#define awgLog(fmt, ...)                                \
    __awgLog(AwgCtl::Log::Force, fmt, ##__VA_ARGS__)

#endif
