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
#include <iostream>

#include "freshness.hpp"

namespace slmaplibs { namespace storage {

Freshness evaluateFreshness(const boost::optional<CacheEntry> &entry
                            , std::time_t now)
{
    if (!entry) { return Freshness(FreshnessState::absent); }

    if (entry->expires && (*entry->expires > now)) {
        return Freshness(FreshnessState::fresh);
    }

    // stale or without explicit lifetime -> must revalidate
    Freshness f(FreshnessState::needsRevalidation);
    f.validators.etag = entry->etag;
    f.validators.lastModified = entry->lastModified;
    return f;
}

void refresh(CacheEntry &entry, const CacheEntry &notModified)
{
    // 304 may omit validators, keep the old ones then
    if (notModified.etag) { entry.etag = notModified.etag; }
    if (notModified.lastModified) {
        entry.lastModified = notModified.lastModified;
    }
    entry.expires = notModified.expires;
    entry.stored = notModified.stored;
}

std::ostream& operator<<(std::ostream &os, const CacheEntry &entry)
{
    os << "{size=" << entry.payload.size();
    if (entry.absent) { os << ", absent"; }
    if (entry.etag) { os << ", etag=" << *entry.etag; }
    if (entry.lastModified) { os << ", lastModified=" << *entry.lastModified; }
    if (entry.expires) { os << ", expires=" << *entry.expires; }
    return os << ", stored=" << entry.stored << '}';
}

} } // namespace slmaplibs::storage
