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

#define CATCH_CONFIG_MAIN

#include "../../lib/awgctl-utils/log.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace AwgCtl;

namespace {

struct Message {
    Log::Level level;
    std::string func;
    std::string msg;
};

struct LogCapture {
    LogCapture()
    {
        Log::pushLogger([this] (Log::Level level, const char *func, const char *msg) {
            msgs.push_back({level, func ? func : "", msg});
        });
    }
    ~LogCapture()
    {
        Log::popLogger();
    }
    std::vector<Message> msgs;
};

static void log_something(int v)
{
    awgInfo("value %d\n", v);
    awgDebug("debug %d\n", v);
    awgWarn("warn %s\n", "x");
    awgError("error\n");
}

}

TEST_CASE("capture") {
    auto old_level = Log::level;
    Log::level = Log::Info;
    LogCapture capture;
    log_something(3);
    REQUIRE(capture.msgs.size() == 3);
    REQUIRE(capture.msgs[0].level == Log::Info);
    REQUIRE(capture.msgs[0].func == "log_something");
    REQUIRE(capture.msgs[0].msg == "value 3\n");
    REQUIRE(capture.msgs[1].level == Log::Warn);
    REQUIRE(capture.msgs[1].msg == "warn x\n");
    REQUIRE(capture.msgs[2].level == Log::Error);

    capture.msgs.clear();
    Log::level = Log::Debug;
    log_something(4);
    REQUIRE(capture.msgs.size() == 4);
    REQUIRE(capture.msgs[1].msg == "debug 4\n");

    capture.msgs.clear();
    Log::level = Log::Force;
    log_something(5);
    awgLog("forced\n");
    REQUIRE(capture.msgs.size() == 1);
    REQUIRE(capture.msgs[0].msg == "forced\n");
    Log::level = old_level;
}

TEST_CASE("nested") {
    auto old_level = Log::level;
    Log::level = Log::Info;
    LogCapture outer;
    {
        LogCapture inner;
        Log::info("inner %d\n", 1);
        REQUIRE(inner.msgs.size() == 1);
        REQUIRE(inner.msgs[0].msg == "inner 1\n");
    }
    Log::warn("outer\n");
    REQUIRE(outer.msgs.size() == 1);
    REQUIRE(outer.msgs[0].level == Log::Warn);
    Log::level = old_level;
}
