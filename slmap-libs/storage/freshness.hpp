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
 * \file storage/freshness.hpp
 *
 * Cache entry and its freshness evaluation.
 */

#ifndef slmaplibs_storage_freshness_hpp_included_
#define slmaplibs_storage_freshness_hpp_included_

#include <ctime>
#include <string>
#include <iosfwd>

#include <boost/optional.hpp>

#include "utility/enum-io.hpp"

namespace slmaplibs { namespace storage {

/** Single cached item: payload plus HTTP freshness metadata.
 */
struct CacheEntry {
    /** Raw payload (encoded image, resolved value).
     */
    std::string payload;

    /** Validators usable in a conditional request.
     */
    boost::optional<std::string> etag;
    boost::optional<std::time_t> lastModified;

    /** Explicit end of freshness lifetime.
     */
    boost::optional<std::time_t> expires;

    /** Time the entry has been (re)stored.
     */
    std::time_t stored;

    /** Known-absent marker: remote side told us there is nothing here.
     */
    bool absent;

    CacheEntry() : stored(), absent(false) {}

    bool hasValidator() const { return etag || lastModified; }
};

struct Validators {
    boost::optional<std::string> etag;
    boost::optional<std::time_t> lastModified;

    bool empty() const { return !etag && !lastModified; }
};

UTILITY_GENERATE_ENUM(FreshnessState,
                      ((fresh))
                      ((needsRevalidation))
                      ((absent))
                      )

struct Freshness {
    FreshnessState state;
    Validators validators;

    Freshness(FreshnessState state = FreshnessState::absent)
        : state(state)
    {}
};

/** Evaluates entry freshness at given time.
 *
 *  * no entry -> absent
 *  * expires in the future -> fresh
 *  * otherwise -> needsRevalidation, with validators if the entry has any
 *    (an entry with neither lifetime nor validator is always revalidated,
 *    i.e. refetched)
 */
Freshness evaluateFreshness(const boost::optional<CacheEntry> &entry
                            , std::time_t now);

/** Updates freshness metadata of an entry from a "not modified" answer. The
 *  payload is untouched.
 */
void refresh(CacheEntry &entry, const CacheEntry &notModified);

std::ostream& operator<<(std::ostream &os, const CacheEntry &entry);

} } // namespace slmaplibs::storage

#endif // slmaplibs_storage_freshness_hpp_included_
