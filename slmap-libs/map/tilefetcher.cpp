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

#include <boost/format.hpp>

#include <opencv2/imgcodecs/imgcodecs.hpp>

#include "dbglog/dbglog.hpp"

#include "../storage/error.hpp"

#include "cachecontrol.hpp"
#include "remote.hpp"
#include "tilefetcher.hpp"

namespace slmaplibs { namespace map {

TileFetcher::TileFetcher(storage::PersistentCache &cache
                         , storage::RateLimiter &limiter
                         , const HttpClient::pointer &client
                         , const Options &options)
    : cache_(cache), limiter_(limiter), client_(client), options_(options)
{}

std::string TileFetcher::url(const TileId &tileId) const
{
    return str(boost::format(options_.tileUrl())
               % tileId.zoom().level() % tileId.origin().x()
               % tileId.origin().y());
}

std::string TileFetcher::cacheKey(const TileId &tileId)
{
    return str(boost::format("tile/%d-%d-%d")
               % tileId.zoom().level() % tileId.origin().x()
               % tileId.origin().y());
}

Tile TileFetcher::fetch(const TileId &tileId)
{
    std::promise<Tile> promise;
    std::shared_future<Tile> future;
    bool owner(false);

    {
        std::unique_lock<std::mutex> lock(inFlightMutex_);
        auto finFlight(inFlight_.find(tileId));
        if (finFlight == inFlight_.end()) {
            future = promise.get_future().share();
            inFlight_.insert(InFlight::value_type(tileId, future));
            owner = true;
        } else {
            future = finFlight->second;
        }
    }

    if (!owner) {
        LOG(debug) << "Tile " << tileId << " already being fetched; waiting.";
        return future.get();
    }

    try {
        promise.set_value(fetchImpl(tileId));
    } catch (...) {
        // forwarded to all waiters
        promise.set_exception(std::current_exception());
    }

    {
        std::unique_lock<std::mutex> lock(inFlightMutex_);
        inFlight_.erase(tileId);
    }

    return future.get();
}

Tile TileFetcher::fetchImpl(const TileId &tileId)
{
    const auto key(cacheKey(tileId));
    auto entry(cache_.get(key));

    const auto freshness(storage::evaluateFreshness(entry, std::time(nullptr)));

    if (freshness.state == storage::FreshnessState::fresh) {
        LOG(debug) << "Tile " << tileId << " served from cache.";
        if (entry->absent) { return Tile(); }
        return decode(tileId, entry->payload);
    }

    HttpRequest request(url(tileId), options_.ioWait());
    if (freshness.state == storage::FreshnessState::needsRevalidation) {
        request.ifNoneMatch = freshness.validators.etag;
        request.ifModifiedSince = freshness.validators.lastModified;
    }

    const auto response(remote::perform(*client_, limiter_, request
                                        , options_));
    const auto now(std::time(nullptr));

    switch (response.status) {
    case 200: {
        auto fresh(entryFromResponse(response, now));
        // never store what we cannot use
        auto tile(decode(tileId, fresh.payload));
        cache_.put(key, fresh);
        return tile;
    }

    case 304:
        if (!entry) {
            LOGTHROW(err2, storage::UnexpectedResponse)
                << "Tile " << tileId << " reported as not modified but "
                "there is nothing cached.";
        }
        storage::refresh(*entry, entryFromResponse(response, now));
        if (entry->absent && !entry->expires) {
            entry->expires = now + std::time_t(options_.absentTtl());
        }
        cache_.put(key, *entry);
        LOG(debug) << "Tile " << tileId << " revalidated.";
        if (entry->absent) { return Tile(); }
        return decode(tileId, entry->payload);

    case 403: case 404:
        // tile CDN answers 403 for missing objects
        LOG(info1) << "Tile " << tileId << " does not exist.";
        cache_.put(key, absentEntry(response, now, options_.absentTtl()));
        return Tile();

    default: break;
    }

    LOGTHROW(err2, storage::UnexpectedResponse)
        << "Unexpected HTTP status " << response.status
        << " when fetching tile " << tileId << " from <"
        << request.url << ">.";
    return Tile();
}

Tile TileFetcher::decode(const TileId &tileId, const std::string &payload)
    const
{
    cv::Mat image;
    if (!payload.empty()) {
        const cv::Mat raw(1, int(payload.size()), CV_8UC1
                          , const_cast<char*>(payload.data()));
        image = cv::imdecode(raw, cv::IMREAD_COLOR);
    }

    if (image.empty()) {
        LOGTHROW(err2, storage::FormatError)
            << "Unable to decode tile " << tileId << " image ("
            << payload.size() << " bytes).";
    }

    return Tile(image);
}

} } // namespace slmaplibs::map
