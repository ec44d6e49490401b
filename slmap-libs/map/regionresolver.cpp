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
#include <map>
#include <mutex>
#include <cstdint>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/member.hpp>

#include "dbglog/dbglog.hpp"

#include "../storage/error.hpp"

#include "cachecontrol.hpp"
#include "remote.hpp"
#include "regionresolver.hpp"

namespace ba = boost::algorithm;

namespace slmaplibs { namespace map {

namespace {

bool stripAffixes(std::string &value, const std::string &prefix
                  , const std::string &suffix)
{
    if ((value.size() < (prefix.size() + suffix.size()))
        || !ba::starts_with(value, prefix)
        || !ba::ends_with(value, suffix))
    {
        return false;
    }

    value = value.substr(prefix.size()
                         , value.size() - prefix.size() - suffix.size());
    return true;
}

GridIndex gridIndex(const std::string &value, const std::string &body)
{
    try {
        return boost::lexical_cast<GridIndex>(ba::trim_copy(value));
    } catch (const boost::bad_lexical_cast&) {
        LOGTHROW(err1, storage::FormatError)
            << "Invalid grid coordinate <" << value
            << "> in region lookup answer <" << body << ">.";
    }
    return 0;
}

} // namespace

boost::optional<GridCoordinates>
parseCoordinatesResponse(const std::string &raw)
{
    const auto body(ba::trim_copy(raw));
    if (body == "var coords = {'error' : true };") { return boost::none; }

    auto value(body);
    if (!stripAffixes(value, "var coords = {'x' : ", " };")) {
        LOGTHROW(err1, storage::FormatError)
            << "Unexpected region lookup answer <" << body << ">.";
    }

    const auto separator(value.find(", 'y' : "));
    if (separator == std::string::npos) {
        LOGTHROW(err1, storage::FormatError)
            << "Unexpected region lookup answer <" << body << ">.";
    }

    return GridCoordinates(gridIndex(value.substr(0, separator), body)
                           , gridIndex(value.substr(separator + 8), body));
}

boost::optional<std::string> parseNameResponse(const std::string &raw)
{
    const auto body(ba::trim_copy(raw));
    if (body == "var region = {'error' : true };") { return boost::none; }

    auto value(body);
    if (!stripAffixes(value, "var region='", "';") || value.empty()) {
        LOGTHROW(err1, storage::FormatError)
            << "Unexpected region name answer <" << body << ">.";
    }

    return value;
}

struct RegionResolver::Lru {
    struct Record {
        Record(const std::string &key, const storage::CacheEntry &entry
               , std::uint64_t lastHit)
            : key(key), lastHit(lastHit), entry(entry)
        {}

        std::string key;
        std::uint64_t lastHit;
        storage::CacheEntry entry;
    };

    struct KeyIdx {};
    struct LastHitIdx {};

    typedef boost::multi_index_container<
        Record
        , boost::multi_index::indexed_by<
              boost::multi_index::ordered_unique
              <boost::multi_index::tag<KeyIdx>
               , BOOST_MULTI_INDEX_MEMBER
               (Record, std::string, key)>
              , boost::multi_index::ordered_unique
              <boost::multi_index::tag<LastHitIdx>
               , BOOST_MULTI_INDEX_MEMBER
               (Record, std::uint64_t, lastHit)>
              >
        > Map;

    Lru(std::size_t capacity) : capacity(capacity), tick(0) {}

    boost::optional<storage::CacheEntry> get(const std::string &key) {
        std::lock_guard<std::mutex> lock(mutex);
        auto &idx(map.get<KeyIdx>());
        auto fmap(idx.find(key));
        if (fmap == idx.end()) { return boost::none; }

        const auto now(++tick);
        idx.modify(fmap, [now](Record &r) { r.lastHit = now; });
        return fmap->entry;
    }

    void put(const std::string &key, const storage::CacheEntry &entry) {
        if (!capacity) { return; }

        std::lock_guard<std::mutex> lock(mutex);
        auto &idx(map.get<KeyIdx>());
        auto fmap(idx.find(key));
        const auto now(++tick);
        if (fmap != idx.end()) {
            idx.modify(fmap, [&](Record &r) {
                    r.lastHit = now; r.entry = entry;
                });
            return;
        }

        idx.insert(Record(key, entry, now));

        // evict least recently used
        auto &hidx(map.get<LastHitIdx>());
        while (map.size() > capacity) {
            LOG(debug) << "Evicting <" << hidx.begin()->key
                       << "> from region cache.";
            hidx.erase(hidx.begin());
        }
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return map.size();
    }

    const std::size_t capacity;
    std::uint64_t tick;
    Map map;
    mutable std::mutex mutex;
};

RegionResolver::RegionResolver(storage::PersistentCache &cache
                               , storage::RateLimiter &limiter
                               , const HttpClient::pointer &client
                               , const Options &options)
    : cache_(cache), limiter_(limiter), client_(client), options_(options)
    , lru_(new Lru(options.lruCapacity()))
{}

RegionResolver::~RegionResolver() {}

std::string RegionResolver::nameUrl(const std::string &name) const
{
    return str(boost::format("%s?var=coords&sim_name=%s")
               % options_.regionByNameUrl()
               % ba::replace_all_copy(name, " ", "%20"));
}

std::string RegionResolver::coordinatesUrl(const GridCoordinates &gc) const
{
    return str(boost::format("%s?var=region&grid_x=%d&grid_y=%d")
               % options_.regionByCoordsUrl() % gc.x() % gc.y());
}

std::string RegionResolver::nameKey(const std::string &name)
{
    return "region-name/" + name;
}

std::string RegionResolver::coordinatesKey(const GridCoordinates &gc)
{
    return str(boost::format("region-coords/%d-%d") % gc.x() % gc.y());
}

std::size_t RegionResolver::memoryCacheSize() const
{
    return lru_->size();
}

template <typename Parser>
auto RegionResolver::lookup(const std::string &key, const std::string &url
                            , bool refresh, Parser parse)
    -> decltype(parse(std::string()))
{
    boost::optional<storage::CacheEntry> entry;
    if (!refresh) {
        entry = lru_->get(key);
        if (!entry) {
            entry = cache_.get(key);
        }
    }

    const auto freshness(storage::evaluateFreshness(entry, std::time(nullptr)));
    if (freshness.state == storage::FreshnessState::fresh) {
        LOG(debug) << "Region lookup <" << key << "> served from cache.";
        auto value(parse(entry->payload));
        lru_->put(key, *entry);
        return value;
    }

    HttpRequest request(url, options_.ioWait());
    if (freshness.state == storage::FreshnessState::needsRevalidation) {
        request.ifNoneMatch = freshness.validators.etag;
        request.ifModifiedSince = freshness.validators.lastModified;
    }

    const auto response(remote::perform(*client_, limiter_, request
                                        , options_));
    const auto now(std::time(nullptr));

    switch (response.status) {
    case 200: {
        const auto fresh(entryFromResponse(response, now));
        auto value(parse(fresh.payload));
        cache_.put(key, fresh);
        lru_->put(key, fresh);
        return value;
    }

    case 304:
        if (entry) {
            storage::refresh(*entry, entryFromResponse(response, now));
            auto value(parse(entry->payload));
            cache_.put(key, *entry);
            lru_->put(key, *entry);
            return value;
        }
        break;

    default: break;
    }

    LOGTHROW(err2, storage::UnexpectedResponse)
        << "Unexpected HTTP status " << response.status
        << " from region lookup <" << url << ">.";
    return decltype(parse(std::string()))();
}

GridCoordinates RegionResolver::resolveName(const std::string &name
                                            , bool refresh)
{
    const auto gc(lookup(nameKey(name), nameUrl(name), refresh
                         , &parseCoordinatesResponse));
    if (!gc) {
        LOGTHROW(err1, storage::NoSuchRegion)
            << "There is no region named <" << name << ">.";
    }
    LOG(debug) << "Region <" << name << "> is at " << *gc << ".";
    return *gc;
}

std::string RegionResolver::resolveCoordinates(const GridCoordinates &gc
                                               , bool refresh)
{
    const auto name(lookup(coordinatesKey(gc), coordinatesUrl(gc), refresh
                           , &parseNameResponse));
    if (!name) {
        LOGTHROW(err1, storage::NoSuchRegion)
            << "There is no region at " << gc << ".";
    }
    return *name;
}

bool RegionResolver::regionExists(const GridCoordinates &gc)
{
    return bool(lookup(coordinatesKey(gc), coordinatesUrl(gc), false
                       , &parseNameResponse));
}

namespace {

GridRectangle routeBounds(const std::vector<GridCoordinates> &regions)
{
    const auto rect(boundingRectangle(regions));
    if (!rect) {
        LOGTHROW(err1, storage::InvalidRectangle)
            << "Cannot compute rectangle of an empty route.";
    }
    return *rect;
}

} // namespace

GridRectangle routeRectangle(RegionResolver &resolver
                             , const std::vector<std::string> &names)
{
    std::vector<GridCoordinates> regions;
    for (const auto &name : names) {
        regions.push_back(resolver.resolveName(name));
    }
    return routeBounds(regions);
}

Route resolveRoute(RegionResolver &resolver
                   , const std::vector<Location> &locations
                   , const Color &color)
{
    std::map<std::string, GridCoordinates> resolved;

    Route route(color);
    for (const auto &location : locations) {
        auto fresolved(resolved.find(location.region));
        if (fresolved == resolved.end()) {
            fresolved = resolved.insert
                (std::make_pair(location.region
                                , resolver.resolveName(location.region)))
                .first;
        }
        route.waypoints.emplace_back(fresolved->second, location.position);
    }
    return route;
}

GridRectangle routeRectangle(const Route &route)
{
    std::vector<GridCoordinates> regions;
    for (const auto &waypoint : route.waypoints) {
        regions.push_back(waypoint.region);
    }
    return routeBounds(regions);
}

} } // namespace slmaplibs::map
