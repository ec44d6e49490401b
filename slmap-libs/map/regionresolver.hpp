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
 * \file map/regionresolver.hpp
 *
 * Region name <-> grid coordinates resolution.
 */

#ifndef slmaplibs_map_regionresolver_hpp_included_
#define slmaplibs_map_regionresolver_hpp_included_

#include <memory>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include "../storage/persistentcache.hpp"
#include "../storage/ratelimiter.hpp"

#include "types.hpp"
#include "location.hpp"
#include "options.hpp"
#include "httpclient.hpp"

namespace slmaplibs { namespace map {

/** Resolves region names to grid coordinates and back.
 *
 *  Answers (including negative ones) are kept in a bounded in-memory LRU
 *  and in the persistent cache; both obey the same freshness rules as
 *  tiles.
 *
 *  Thread safe.
 */
class RegionResolver : boost::noncopyable {
public:
    RegionResolver(storage::PersistentCache &cache
                   , storage::RateLimiter &limiter
                   , const HttpClient::pointer &client
                   , const Options &options = Options());

    ~RegionResolver();

    /** Grid coordinates of named region.
     *
     *  \param name region name
     *  \param refresh bypass both cache tiers
     *  \throws storage::NoSuchRegion if there is no such region
     */
    GridCoordinates resolveName(const std::string &name, bool refresh = false);

    /** Name of region at given grid coordinates.
     *
     *  \throws storage::NoSuchRegion if there is no region there
     */
    std::string resolveCoordinates(const GridCoordinates &gc
                                   , bool refresh = false);

    /** Checks region existence. Transient errors are propagated.
     */
    bool regionExists(const GridCoordinates &gc);

    /** Number of answers held in memory.
     */
    std::size_t memoryCacheSize() const;

    std::string nameUrl(const std::string &name) const;
    std::string coordinatesUrl(const GridCoordinates &gc) const;

    static std::string nameKey(const std::string &name);
    static std::string coordinatesKey(const GridCoordinates &gc);

private:
    struct Lru;

    /** Parses cached or fetched answer stored under given key. Fetched
     *  answer is parsed before it gets cached.
     */
    template <typename Parser>
    auto lookup(const std::string &key, const std::string &url
                , bool refresh, Parser parse)
        -> decltype(parse(std::string()));

    storage::PersistentCache &cache_;
    storage::RateLimiter &limiter_;
    HttpClient::pointer client_;
    const Options options_;

    std::unique_ptr<Lru> lru_;
};

/** Parses name lookup service answer. None for authoritative "no such
 *  region". Throws storage::FormatError on garbage.
 */
boost::optional<GridCoordinates>
parseCoordinatesResponse(const std::string &body);

/** Parses coordinates lookup service answer. None for authoritative "no
 *  region there". Throws storage::FormatError on garbage.
 */
boost::optional<std::string> parseNameResponse(const std::string &body);

/** Bounding rectangle of all named regions.
 *
 *  \throws storage::NoSuchRegion naming the first unresolvable region
 *  \throws storage::InvalidRectangle if names is empty
 */
GridRectangle routeRectangle(RegionResolver &resolver
                             , const std::vector<std::string> &names);

/** Route through given locations. Each distinct region name is resolved
 *  only once.
 *
 *  \throws storage::NoSuchRegion naming the first unresolvable region
 */
Route resolveRoute(RegionResolver &resolver
                   , const std::vector<Location> &locations
                   , const Color &color = Route().color);

/** Bounding rectangle of all route waypoint regions.
 *
 *  \throws storage::InvalidRectangle if route has no waypoint
 */
GridRectangle routeRectangle(const Route &route);

} } // namespace slmaplibs::map

#endif // slmaplibs_map_regionresolver_hpp_included_
