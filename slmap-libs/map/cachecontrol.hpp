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
/**
 * \file map/cachecontrol.hpp
 *
 * HTTP caching headers -> cache entry metadata.
 */

#ifndef slmaplibs_map_cachecontrol_hpp_included_
#define slmaplibs_map_cachecontrol_hpp_included_

#include <ctime>
#include <string>

#include <boost/optional.hpp>

#include "../storage/freshness.hpp"

#include "httpclient.hpp"

namespace slmaplibs { namespace map {

/** Parses HTTP date (RFC 7231 and obsolete forms). None if unparsable.
 */
boost::optional<std::time_t> parseHttpDate(const std::string &value);

/** Formats time as IMF-fixdate (e.g. "Sun, 06 Nov 1994 08:49:37 GMT").
 */
std::string formatHttpDate(std::time_t time);

/** Explicit freshness lifetime end from Cache-Control max-age or Expires.
 *  no-cache and no-store yield none (always revalidate).
 */
boost::optional<std::time_t> responseExpires(const HttpResponse &response
                                             , std::time_t now);

/** Builds cache entry from response: body as payload, validators and
 *  lifetime from headers, stored at now.
 */
storage::CacheEntry entryFromResponse(const HttpResponse &response
                                      , std::time_t now);

/** Builds known-absent marker from "does not exist" response. Lifetime is
 *  taken from response headers, defaultTtl [s] if there is none or if it has
 *  already run out.
 */
storage::CacheEntry absentEntry(const HttpResponse &response
                                , std::time_t now, unsigned long defaultTtl);

} } // namespace slmaplibs::map

#endif // slmaplibs_map_cachecontrol_hpp_included_
