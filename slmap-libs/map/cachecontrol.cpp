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
#include <cstdlib>
#include <algorithm>
#include <vector>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <curl/curl.h>

#include "dbglog/dbglog.hpp"

#include "cachecontrol.hpp"

namespace ba = boost::algorithm;

namespace slmaplibs { namespace map {

namespace {

struct CacheControl {
    bool noCache;
    boost::optional<long> maxAge;

    CacheControl() : noCache(false) {}
};

CacheControl parseCacheControl(const std::string &value)
{
    CacheControl cc;

    std::vector<std::string> directives;
    ba::split(directives, value, ba::is_any_of(","));

    for (auto directive : directives) {
        ba::trim(directive);
        ba::to_lower(directive);

        if ((directive == "no-cache") || (directive == "no-store")) {
            cc.noCache = true;
        } else if (ba::starts_with(directive, "max-age=")) {
            const auto number(directive.substr(8));
            char *end(nullptr);
            const auto maxAge(std::strtol(number.c_str(), &end, 10));
            if (!number.empty() && end && !*end && (maxAge >= 0)) {
                cc.maxAge = maxAge;
            } else {
                LOG(warn1) << "Ignoring invalid max-age <"
                           << directive << ">.";
            }
        }
    }

    return cc;
}

} // namespace

boost::optional<std::time_t> parseHttpDate(const std::string &value)
{
    const auto t(curl_getdate(value.c_str(), nullptr));
    if (t < 0) { return boost::none; }
    return std::time_t(t);
}

std::string formatHttpDate(std::time_t time)
{
    std::tm tm;
    ::gmtime_r(&time, &tm);

    char buf[64];
    const auto size(std::strftime(buf, sizeof(buf)
                                  , "%a, %d %b %Y %H:%M:%S GMT", &tm));
    return std::string(buf, size);
}

boost::optional<std::time_t> responseExpires(const HttpResponse &response
                                             , std::time_t now)
{
    if (const auto *value = response.header("cache-control")) {
        const auto cc(parseCacheControl(*value));
        if (cc.noCache) { return boost::none; }
        if (cc.maxAge) {
            // time already spent in intermediate caches
            long age(0);
            if (const auto *ageValue = response.header("age")) {
                age = std::max(0l, std::strtol(ageValue->c_str(), nullptr, 10));
            }
            return now + std::max(0l, *cc.maxAge - age);
        }
    }

    if (const auto *pragma = response.header("pragma")) {
        if (ba::icontains(*pragma, "no-cache")) { return boost::none; }
    }

    if (const auto *value = response.header("expires")) {
        const auto expires(parseHttpDate(*value));
        // invalid date means already expired
        if (!expires) { return now; }

        // use server clock if possible to avoid clock skew
        if (const auto *dateValue = response.header("date")) {
            if (const auto date = parseHttpDate(*dateValue)) {
                return now + (*expires - *date);
            }
        }
        return *expires;
    }

    return boost::none;
}

storage::CacheEntry entryFromResponse(const HttpResponse &response
                                      , std::time_t now)
{
    storage::CacheEntry entry;
    entry.payload = response.body;
    entry.stored = now;
    entry.expires = responseExpires(response, now);

    if (const auto *etag = response.header("etag")) {
        entry.etag = *etag;
    }
    if (const auto *lastModified = response.header("last-modified")) {
        entry.lastModified = parseHttpDate(*lastModified);
    }

    return entry;
}

storage::CacheEntry absentEntry(const HttpResponse &response
                                , std::time_t now, unsigned long defaultTtl)
{
    auto entry(entryFromResponse(response, now));
    entry.payload.clear();
    entry.absent = true;
    // lifetime already over on arrival: use default
    if (!entry.expires || (*entry.expires <= now)) {
        entry.expires = now + std::time_t(defaultTtl);
    }
    return entry;
}

} } // namespace slmaplibs::map
