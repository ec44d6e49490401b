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
#include <sstream>
#include <iostream>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/buildsys.hpp"
#include "utility/gccversion.hpp"
#include "service/cmdline.hpp"

#include "../storage/error.hpp"
#include "../storage/persistentcache.hpp"
#include "../storage/ratelimiter.hpp"
#include "../map/types.hpp"
#include "../map/zoom.hpp"
#include "../map/options.hpp"
#include "../map/location.hpp"
#include "../map/httpclient.hpp"
#include "../map/threadpool.hpp"
#include "../map/tilefetcher.hpp"
#include "../map/regionresolver.hpp"
#include "../map/mosaic.hpp"
#include "../map/routeoverlay.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;
namespace storage = slmaplibs::storage;
namespace map = slmaplibs::map;

class SlMap : public service::Cmdline
{
public:
    SlMap()
        : Cmdline("slmap", BUILD_TARGET_VERSION
                  , service::DISABLE_EXCESSIVE_LOGGING)
        , maxWidth_(2048), maxHeight_(2048)
        , routeColor_(0xff, 0x00, 0x00)
    {}

private:
    virtual void configuration(po::options_description &cmdline
                               , po::options_description &config
                               , po::positional_options_description &pd)
        UTILITY_OVERRIDE;

    virtual void configure(const po::variables_map &vars)
        UTILITY_OVERRIDE;

    virtual bool help(std::ostream &out, const std::string &what) const
        UTILITY_OVERRIDE;

    virtual int run() UTILITY_OVERRIDE;

    fs::path cacheDir_;
    fs::path output_;
    boost::optional<fs::path> outputWithoutRoute_;
    unsigned int maxWidth_;
    unsigned int maxHeight_;
    map::MosaicOptions mosaicOptions_;
    map::Color routeColor_;
    boost::optional<map::GridRectangle> rectangle_;
    std::vector<map::Location> waypoints_;
    map::Options options_;
};

void SlMap::configuration(po::options_description &cmdline
                          , po::options_description &config
                          , po::positional_options_description &pd)
{
    cmdline.add_options()
        ("cacheDir", po::value(&cacheDir_)->required()
         , "Directory where fetched tiles and region lookups are cached.")
        ("output", po::value(&output_)->required()
         , "Output image file; format derived from extension.")
        ("outputWithoutRoute", po::value<fs::path>()
         , "Optional output image file without route drawn.")
        ("maxWidth", po::value(&maxWidth_)->default_value(maxWidth_)
         , "Maximum width of output image in pixels.")
        ("maxHeight", po::value(&maxHeight_)->default_value(maxHeight_)
         , "Maximum height of output image in pixels.")
        ("missingTileColor"
         , po::value(&mosaicOptions_.missingTileColor)
         ->default_value(mosaicOptions_.missingTileColor)
         , "Fill color of missing tiles (#rgb, #rrggbb or #rrggbbaa).")
        ("missingRegionColor"
         , po::value<map::Color>()->implicit_value(map::WaterColor)
         , "Fill color of non-existent regions; defaults to water color "
         "when given without value. Regions are not checked when not "
         "given at all.")
        ("color", po::value(&routeColor_)->default_value(routeColor_)
         , "Route color.")
        ("rectangle", po::value<map::GridRectangle>()
         , "Grid rectangle to render: llx,lly,urx,ury. Conflicts with "
         "waypoint.")
        ("waypoint", po::value<std::vector<std::string>>()
         , "Route waypoint: \"Region Name/x/y/z\"; use multiple times "
         "for whole route. Conflicts with rectangle.")
        ;

    options_.configuration(config);

    (void) pd;
}

void SlMap::configure(const po::variables_map &vars)
{
    options_.configure(vars);

    if (vars.count("outputWithoutRoute")) {
        outputWithoutRoute_ = vars["outputWithoutRoute"].as<fs::path>();
    }

    if (vars.count("missingRegionColor")) {
        mosaicOptions_.missingRegionColor
            = vars["missingRegionColor"].as<map::Color>();
    }

    const bool rectangle(vars.count("rectangle"));
    const bool waypoint(vars.count("waypoint"));

    if (rectangle && waypoint) {
        throw po::error("conflicting options rectangle+waypoint");
    }

    if (rectangle) {
        rectangle_ = vars["rectangle"].as<map::GridRectangle>();
    } else if (waypoint) {
        for (const auto &wp
                 : vars["waypoint"].as<std::vector<std::string>>())
        {
            try {
                waypoints_.push_back(map::Location::parse(wp));
            } catch (const storage::FormatError&) {
                throw po::validation_error
                    (po::validation_error::invalid_option_value
                     , "waypoint", wp);
            }
        }
    } else {
        throw po::required_option("rectangle|waypoint");
    }

    std::ostringstream os;
    options_.dump(os, "\t");
    LOG(info3) << "Config:"
               << "\n\tcacheDir = " << cacheDir_
               << "\n\toutput = " << output_
               << "\n\tmaxWidth = " << maxWidth_
               << "\n\tmaxHeight = " << maxHeight_
               << "\n" << os.str();
}

bool SlMap::help(std::ostream &out, const std::string &what) const
{
    if (what.empty()) {
        out << R"RAW(slmap: renders Second Life grid map image

    slmap --cacheDir DIR --output FILE --rectangle llx,lly,urx,ury [options]
    slmap --cacheDir DIR --output FILE --waypoint LOCATION... [options]

Selects the most detailed zoom level at which the map fits into the given
size, fetches (and caches) all needed map tiles and composes them into one
image. In waypoint mode the route is drawn over the map.
)RAW";
    }
    return false;
}

int SlMap::run()
{
    storage::PersistentCache cache(cacheDir_);
    storage::RateLimiter limiter(options_.throttleRate()
                                 , options_.throttleBurst());
    auto client(map::CurlHttpClient::create());

    map::TileFetcher fetcher(cache, limiter, client, options_);
    map::RegionResolver resolver(cache, limiter, client, options_);
    map::ThreadPool pool(options_.fanOut());
    map::MosaicCompositor compositor(fetcher, resolver, pool, options_);

    boost::optional<map::Route> route;
    auto rect([&]() -> map::GridRectangle
    {
        if (rectangle_) { return *rectangle_; }

        route = map::resolveRoute(resolver, waypoints_, routeColor_);
        return map::routeRectangle(*route);
    }());

    const auto selection(map::selectZoom(rect, maxWidth_, maxHeight_));
    if (!selection.fits) {
        LOG(warn3) << "Map does not fit into " << maxWidth_ << "x"
                   << maxHeight_ << "; output will be " << selection.size
                   << ".";
    }

    const auto mosaic(compositor.compose(rect, selection.zoom
                                         , mosaicOptions_));

    if (route) {
        const auto overlay(map::drawRoute(mosaic, *route
                                          , map::OverlayOptions()
                                          , bool(outputWithoutRoute_)));
        overlay.withRoute.write(output_);
        if (overlay.withoutRoute) {
            overlay.withoutRoute->write(*outputWithoutRoute_);
        }
    } else {
        mosaic.write(output_);
        if (outputWithoutRoute_) { mosaic.write(*outputWithoutRoute_); }
    }

    std::cout << "aspect ratio: " << mosaic.aspectRatio() << '\n'
              << "pps hud: " << mosaic.ppsHudConfig() << std::endl;

    return EXIT_SUCCESS;
}

int main(int argc, char *argv[])
{
    return SlMap()(argc, argv);
}
