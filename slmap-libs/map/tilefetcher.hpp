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
 * \file map/tilefetcher.hpp
 *
 * Cached, freshness aware map tile access.
 */

#ifndef slmaplibs_map_tilefetcher_hpp_included_
#define slmaplibs_map_tilefetcher_hpp_included_

#include <map>
#include <mutex>
#include <future>
#include <string>

#include <boost/noncopyable.hpp>

#include <opencv2/core/core.hpp>

#include "../storage/persistentcache.hpp"
#include "../storage/ratelimiter.hpp"

#include "types.hpp"
#include "options.hpp"
#include "httpclient.hpp"

namespace slmaplibs { namespace map {

struct Tile {
    enum class Type { valid, notFound };

    Type type;

    /** Decoded image (8-bit BGR), empty if not found.
     */
    cv::Mat image;

    Tile(Type type = Type::notFound) : type(type) {}
    Tile(const cv::Mat &image) : type(Type::valid), image(image) {}

    bool valid() const { return type == Type::valid; }
};

/** Fetches map tiles through the persistent cache.
 *
 *  Fresh cache entries are served without touching the network, stale ones
 *  are revalidated by a conditional request. Concurrent fetches of the same
 *  tile share a single remote request.
 *
 *  Thread safe.
 */
class TileFetcher : boost::noncopyable {
public:
    TileFetcher(storage::PersistentCache &cache
                , storage::RateLimiter &limiter
                , const HttpClient::pointer &client
                , const Options &options = Options());

    /** Returns tile; notFound if the tile service has no such tile.
     *
     *  Throws storage::TransientError when the remote side keeps failing,
     *  storage::UnexpectedResponse on unexpected HTTP status and
     *  storage::FormatError if payload cannot be decoded.
     */
    Tile fetch(const TileId &tileId);

    /** Remote URL of given tile.
     */
    std::string url(const TileId &tileId) const;

    /** Persistent cache key of given tile.
     */
    static std::string cacheKey(const TileId &tileId);

    const Options& options() const { return options_; }

private:
    Tile fetchImpl(const TileId &tileId);

    Tile decode(const TileId &tileId, const std::string &payload) const;

    storage::PersistentCache &cache_;
    storage::RateLimiter &limiter_;
    HttpClient::pointer client_;
    const Options options_;

    typedef std::map<TileId, std::shared_future<Tile>> InFlight;

    std::mutex inFlightMutex_;
    InFlight inFlight_;
};

} } // namespace slmaplibs::map

#endif // slmaplibs_map_tilefetcher_hpp_included_
