/**
 * Copyright (c) 2017 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */
#include <catch2/catch.hpp>

#include "slmap-libs/map/cachecontrol.hpp"

#include "fakehttp.hpp"

namespace map = slmaplibs::map;
namespace test = slmaplibs::test;

namespace {

const std::time_t Now(1700000000);

} // namespace

TEST_CASE("http dates", "[cachecontrol]")
{
    const auto t(map::parseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT"));
    REQUIRE(t);
    CHECK(*t == 784111777);
    CHECK(map::formatHttpDate(784111777) == "Sun, 06 Nov 1994 08:49:37 GMT");

    CHECK_FALSE(map::parseHttpDate("yesterday-ish"));
}

TEST_CASE("max-age gives explicit lifetime", "[cachecontrol]")
{
    const auto entry(map::entryFromResponse
                     (test::response(200, "body"
                                     , {{ "cache-control"
                                          , "public, max-age=600" }
                                         , { "etag", "\"x1\"" }})
                      , Now));
    CHECK(entry.payload == "body");
    REQUIRE(entry.expires);
    CHECK(*entry.expires == Now + 600);
    REQUIRE(entry.etag);
    CHECK(*entry.etag == "\"x1\"");
    CHECK(entry.stored == Now);
    CHECK_FALSE(entry.absent);
}

TEST_CASE("no-cache means no lifetime", "[cachecontrol]")
{
    const auto entry(map::entryFromResponse
                     (test::response(200, "body"
                                     , {{ "cache-control"
                                          , "no-cache, max-age=600" }
                                         , { "last-modified"
                                             , "Sun, 06 Nov 1994 08:49:37 GMT"
                                             }})
                      , Now));
    CHECK_FALSE(entry.expires);
    REQUIRE(entry.lastModified);
    CHECK(*entry.lastModified == 784111777);
}

TEST_CASE("expires is relative to server date", "[cachecontrol]")
{
    const auto entry(map::entryFromResponse
                     (test::response(200, ""
                                     , {{ "date"
                                          , "Sun, 06 Nov 1994 08:49:37 GMT" }
                                         , { "expires"
                                             , "Sun, 06 Nov 1994 09:49:37 GMT"
                                             }})
                      , Now));
    REQUIRE(entry.expires);
    CHECK(*entry.expires == Now + 3600);

    const auto invalid(map::entryFromResponse
                       (test::response(200, "", {{ "expires", "0" }}), Now));
    REQUIRE(invalid.expires);
    CHECK(*invalid.expires == Now);
}

TEST_CASE("absent marker lifetime", "[cachecontrol]")
{
    const auto dflt(map::absentEntry(test::response(404, "Not Found")
                                     , Now, 86400));
    CHECK(dflt.absent);
    CHECK(dflt.payload.empty());
    REQUIRE(dflt.expires);
    CHECK(*dflt.expires == Now + 86400);

    const auto explicitTtl(map::absentEntry
                           (test::response(404, ""
                                           , {{ "cache-control"
                                                , "max-age=60" }})
                            , Now, 86400));
    REQUIRE(explicitTtl.expires);
    CHECK(*explicitTtl.expires == Now + 60);

    const auto zeroMaxAge(map::absentEntry
                          (test::response(404, ""
                                          , {{ "cache-control"
                                               , "max-age=0" }})
                           , Now, 86400));
    REQUIRE(zeroMaxAge.expires);
    CHECK(*zeroMaxAge.expires == Now + 86400);

    const auto badExpires(map::absentEntry
                          (test::response(404, "", {{ "expires", "0" }})
                           , Now, 86400));
    REQUIRE(badExpires.expires);
    CHECK(*badExpires.expires == Now + 86400);
}
