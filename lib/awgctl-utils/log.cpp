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

#include "log.h"

#include <mutex>
#include <string>
#include <vector>

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <strings.h>
#include <unistd.h>

namespace AwgCtl {
namespace Log {

static thread_local std::vector<cb_t> loggers;

AWGCTL_EXPORT() void pushLogger(cb_t cb)
{
    loggers.push_back(cb);
}

AWGCTL_EXPORT() void popLogger()
{
    if (loggers.empty())
        return;
    loggers.pop_back();
}

static cb_t get_logger()
{
    if (loggers.empty())
        return cb_t();
    return loggers.back();
}

AWGCTL_EXPORT() Level level = [] {
    auto env = getenv("AWGCTL_LOG");
    if (!env)
        return Info;
    if (strcasecmp(env, "debug") == 0)
        return Debug;
    else if (strcasecmp(env, "info") == 0)
        return Info;
    else if (strcasecmp(env, "warn") == 0 || strcasecmp(env, "warning") == 0)
        return Warn;
    else if (strcasecmp(env, "error") == 0)
        return Error;
    else if (strcasecmp(env, "none") == 0)
        return Force;
    return Info;
}();

static bool print_pid = true;
AWGCTL_EXPORT() bool printPID()
{
    return print_pid;
}

AWGCTL_EXPORT() void printPID(bool b)
{
    print_pid = b;
}

static AWGCTL_INLINE bool _checkLevel(unsigned _level)
{
    return _level <= Force && _level >= level;
}

AWGCTL_EXPORT() void _logV(Level level, const char *func, const char *fmt, va_list ap)
{
    AWGCTL_RET_IF_FAIL(_checkLevel(level));
    auto logger = get_logger();
    if (logger) {
        va_list aq;
        va_copy(aq, ap);
        auto size = vsnprintf(nullptr, 0, fmt, aq);
        va_end(aq);
        if (size < 0) {
            logger(Error, __func__, "Unable to format message\n");
            return;
        }
        // size doesn't include the NUL byte at the end.
        std::string str(size_t(size) + 1, '\0');
        vsnprintf(&str[0], str.size(), fmt, ap);
        str.resize(size_t(size));
        logger(level, func, str.c_str());
        return;
    }

    static const char *const log_prefixes[] = {
        "Debug",
        "Info",
        "Warn",
        "Error",
    };

    static std::mutex log_lock;
    {
        std::lock_guard<std::mutex> lk(log_lock);
        if (print_pid) {
            int pid = getpid();
            if (level == Force) {
                fprintf(stderr, "%d: ", pid);
            }
            else if (func) {
                fprintf(stderr, "%s-%d %s ", log_prefixes[(int)level], pid, func);
            }
            else {
                fprintf(stderr, "%s-%d ", log_prefixes[(int)level], pid);
            }
        }
        else if (level == Force) {
        }
        else if (func) {
            fprintf(stderr, "%s: %s ", log_prefixes[(int)level], func);
        }
        else {
            fprintf(stderr, "%s: ", log_prefixes[(int)level]);
        }
        vfprintf(stderr, fmt, ap);
    }
    fflush(stderr);
}

AWGCTL_EXPORT() void _log(Level level, const char *func, const char *fmt, ...)
{
    AWGCTL_RET_IF_FAIL(_checkLevel(level));
    va_list ap;
    va_start(ap, fmt);
    _logV(level, func, fmt, ap);
    va_end(ap);
}

AWGCTL_EXPORT() void info(const char *fmt, ...)
{
    AWGCTL_RET_IF_FAIL(_checkLevel(Info));
    va_list ap;
    va_start(ap, fmt);
    _logV(Info, nullptr, fmt, ap);
    va_end(ap);
}

AWGCTL_EXPORT() void warn(const char *fmt, ...)
{
    AWGCTL_RET_IF_FAIL(_checkLevel(Warn));
    va_list ap;
    va_start(ap, fmt);
    _logV(Warn, nullptr, fmt, ap);
    va_end(ap);
}

AWGCTL_EXPORT() void error(const char *fmt, ...)
{
    AWGCTL_RET_IF_FAIL(_checkLevel(Error));
    va_list ap;
    va_start(ap, fmt);
    _logV(Error, nullptr, fmt, ap);
    va_end(ap);
}

AWGCTL_EXPORT() void log(const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    _logV(Force, nullptr, fmt, ap);
    va_end(ap);
}

} // Log
} // AwgCtl
