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
#include <ctime>
#include <fstream>

#include <boost/filesystem.hpp>

#include <catch2/catch.hpp>

#include "slmap-libs/storage/persistentcache.hpp"
#include "slmap-libs/storage/freshness.hpp"

#include "fakehttp.hpp"

namespace fs = boost::filesystem;
namespace storage = slmaplibs::storage;
namespace test = slmaplibs::test;

namespace {

storage::CacheEntry makeEntry(const std::string &payload)
{
    storage::CacheEntry entry;
    entry.payload = payload;
    entry.etag = std::string("\"abc\"");
    entry.lastModified = std::time_t(1500000000);
    entry.expires = std::time_t(2000000000);
    entry.stored = std::time_t(1600000000);
    return entry;
}

} // namespace

TEST_CASE("cache entry survives round trip", "[cache]")
{
    test::TemporaryDirectory tmp;
    storage::PersistentCache cache(tmp.path());

    CHECK_FALSE(cache.get("tile/1-1000-1000"));

    std::string binary("\0\1\2 binary \xff payload", 21);
    cache.put("tile/1-1000-1000", makeEntry(binary));

    const auto entry(cache.get("tile/1-1000-1000"));
    REQUIRE(entry);
    CHECK(entry->payload == binary);
    REQUIRE(entry->etag);
    CHECK(*entry->etag == "\"abc\"");
    REQUIRE(entry->lastModified);
    CHECK(*entry->lastModified == 1500000000);
    REQUIRE(entry->expires);
    CHECK(*entry->expires == 2000000000);
    CHECK(entry->stored == 1600000000);
    CHECK_FALSE(entry->absent);

    // survives reopening
    storage::PersistentCache reopened(tmp.path());
    CHECK(reopened.get("tile/1-1000-1000"));
}

TEST_CASE("cache entry is replaced", "[cache]")
{
    test::TemporaryDirectory tmp;
    storage::PersistentCache cache(tmp.path());

    cache.put("region-name/Da Boom", makeEntry("first"));

    storage::CacheEntry absent;
    absent.absent = true;
    absent.stored = 1;
    cache.put("region-name/Da Boom", absent);

    const auto entry(cache.get("region-name/Da Boom"));
    REQUIRE(entry);
    CHECK(entry->absent);
    CHECK(entry->payload.empty());
    CHECK_FALSE(entry->etag);
    CHECK_FALSE(entry->expires);

    // no stray temporary files
    std::size_t files(0);
    for (fs::recursive_directory_iterator i(tmp.path()), e; i != e; ++i) {
        if (fs::is_regular_file(i->path())) { ++files; }
    }
    CHECK(files == 1);
}

TEST_CASE("similar keys do not collide", "[cache]")
{
    test::TemporaryDirectory tmp;
    storage::PersistentCache cache(tmp.path());

    cache.put("region-name/a b", makeEntry("space"));
    cache.put("region-name/a_b", makeEntry("underscore"));
    cache.put("region-name/a%20b", makeEntry("escaped"));

    CHECK(cache.get("region-name/a b")->payload == "space");
    CHECK(cache.get("region-name/a_b")->payload == "underscore");
    CHECK(cache.get("region-name/a%20b")->payload == "escaped");
}

TEST_CASE("damaged cache file is reported as missing", "[cache]")
{
    test::TemporaryDirectory tmp;
    storage::PersistentCache cache(tmp.path());

    cache.put("tile/2-1000-1000", makeEntry("payload"));
    const auto path(cache.filePath("tile/2-1000-1000"));
    REQUIRE(fs::exists(path));

    SECTION("flipped byte") {
        std::fstream f(path.string(), std::ios::in | std::ios::out
                       | std::ios::binary);
        f.seekp(10);
        f.put('X');
    }

    SECTION("truncated") {
        fs::resize_file(path, fs::file_size(path) / 2);
    }

    CHECK_FALSE(cache.get("tile/2-1000-1000"));
}

TEST_CASE("freshness evaluation", "[cache]")
{
    const std::time_t now(1700000000);

    CHECK(storage::evaluateFreshness(boost::none, now).state
          == storage::FreshnessState::absent);

    storage::CacheEntry entry;
    entry.expires = now + 10;
    CHECK(storage::evaluateFreshness(entry, now).state
          == storage::FreshnessState::fresh);

    entry.expires = now - 10;
    entry.etag = std::string("\"v1\"");
    auto f(storage::evaluateFreshness(entry, now));
    CHECK(f.state == storage::FreshnessState::needsRevalidation);
    REQUIRE(f.validators.etag);
    CHECK(*f.validators.etag == "\"v1\"");

    // neither lifetime nor validator: always revalidate
    storage::CacheEntry bare;
    f = storage::evaluateFreshness(bare, now);
    CHECK(f.state == storage::FreshnessState::needsRevalidation);
    CHECK(f.validators.empty());
}

TEST_CASE("not modified refreshes only metadata", "[cache]")
{
    auto entry(makeEntry("payload"));

    storage::CacheEntry notModified;
    notModified.expires = std::time_t(2100000000);
    notModified.stored = std::time_t(1700000000);
    storage::refresh(entry, notModified);

    CHECK(entry.payload == "payload");
    REQUIRE(entry.etag);
    CHECK(*entry.etag == "\"abc\"");
    CHECK(*entry.expires == 2100000000);
    CHECK(entry.stored == 1700000000);
}
