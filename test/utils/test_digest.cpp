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

#include "../../lib/awgctl-utils/digest.h"

#include <catch2/catch.hpp>

#include <string.h>

using namespace AwgCtl;

static uint64_t digest(const char *str)
{
    return Digest::compute(str, strlen(str));
}

TEST_CASE("fnv1a") {
    REQUIRE(digest("") == 0xcbf29ce484222325ull);
    REQUIRE(digest("a") == 0xaf63dc4c8601ec8cull);
    REQUIRE(digest("foobar") == 0x85944171f73967e8ull);
}

TEST_CASE("incremental") {
    Digest d;
    REQUIRE(d.value() == Digest::offset_basis);
    d.update("foo", 3).update(std::vector<uint8_t>{'b', 'a', 'r'});
    REQUIRE(d.value() == digest("foobar"));
    REQUIRE(digest("foobaz") != digest("foobar"));
}

TEST_CASE("hex") {
    REQUIRE(digest_hex(0) == "0000000000000000");
    REQUIRE(digest_hex(0x85944171f73967e8ull) == "85944171f73967e8");
    REQUIRE(digest_hex(0xabcull) == "0000000000000abc");
}
