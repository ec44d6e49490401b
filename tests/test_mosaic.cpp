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
#include <thread>
#include <chrono>

#include <boost/format.hpp>

#include <catch2/catch.hpp>

#include <opencv2/core/core.hpp>

#include "slmap-libs/map.hpp"

#include "fakehttp.hpp"

namespace storage = slmaplibs::storage;
namespace map = slmaplibs::map;
namespace test = slmaplibs::test;

using map::GridCoordinates;
using map::GridRectangle;
using map::ZoomLevel;
using map::Color;

namespace {

const Color Red(0xff, 0, 0);
const Color Green(0, 0xff, 0);
const Color Blue(0, 0, 0xff);
const Color White(0xff, 0xff, 0xff);

struct Fixture {
    test::TemporaryDirectory tmp;
    storage::PersistentCache cache;
    storage::RateLimiter limiter;
    test::FakeHttpClient::pointer http;
    map::Options options;
    map::ThreadPool pool;

    Fixture()
        : cache(tmp.path()), limiter(0.0)
        , http(std::make_shared<test::FakeHttpClient>())
        , pool(4)
    {
        options.tileUrl("http://tiles.test/%d/%d/%d")
            .regionByNameUrl("http://cap.test/name")
            .regionByCoordsUrl("http://cap.test/coords")
            .ioRetries(0).fanOut(4);
    }

    void tile(int zoom, int x, int y, const Color &color, long delay = 0
              , int size = map::TilePixels)
    {
        http->respond(str(boost::format("http://tiles.test/%d/%d/%d")
                          % zoom % x % y)
                      , test::response(200, test::tileImage(color, size))
                      , delay);
    }

    void region(int x, int y, bool exists) {
        http->respond(str(boost::format("http://cap.test/coords?var=region"
                                        "&grid_x=%d&grid_y=%d") % x % y)
                      , test::response(200, exists
                                       ? "var region='Somewhere';"
                                       : "var region = {'error' : true };"));
    }

    map::Mosaic compose(const GridRectangle &rect, const ZoomLevel &zoom
                        , const map::MosaicOptions &mo
                        = map::MosaicOptions()
                        , const map::Interrupt *interrupt = nullptr)
    {
        map::TileFetcher fetcher(cache, limiter, http, options);
        map::RegionResolver resolver(cache, limiter, http, options);
        map::MosaicCompositor compositor(fetcher, resolver, pool, options);
        return compositor.compose(rect, zoom, mo, interrupt);
    }
};

bool uniform(const cv::Mat &image, const cv::Rect &rect, const Color &color)
{
    const cv::Mat area(image, rect);
    for (int y(0); y < area.rows; ++y) {
        for (int x(0); x < area.cols; ++x) {
            const auto &px(area.at<cv::Vec3b>(y, x));
            if (Color(px[2], px[1], px[0]) != color) { return false; }
        }
    }
    return true;
}

const GridRectangle Pair(GridCoordinates(1000, 1000)
                         , GridCoordinates(1001, 1000));

} // namespace

TEST_CASE("tiles are placed at their offsets", "[mosaic]")
{
    Fixture f;
    f.tile(1, 1000, 1000, Red);
    f.tile(1, 1001, 1000, Blue);

    const auto mosaic(f.compose(Pair, ZoomLevel(1)));
    CHECK(mosaic.width() == 512);
    CHECK(mosaic.height() == 256);
    CHECK(uniform(mosaic.image(), cv::Rect(0, 0, 256, 256), Red));
    CHECK(uniform(mosaic.image(), cv::Rect(256, 0, 256, 256), Blue));
}

TEST_CASE("placement does not depend on arrival order", "[mosaic]")
{
    Fixture slowFirst;
    slowFirst.tile(1, 1000, 1000, Red, 150);
    slowFirst.tile(1, 1001, 1000, Blue);

    Fixture slowSecond;
    slowSecond.tile(1, 1000, 1000, Red);
    slowSecond.tile(1, 1001, 1000, Blue, 150);

    const auto a(slowFirst.compose(Pair, ZoomLevel(1)));
    const auto b(slowSecond.compose(Pair, ZoomLevel(1)));

    cv::Mat diff;
    cv::absdiff(a.image(), b.image(), diff);
    CHECK(cv::countNonZero(diff.reshape(1)) == 0);

    // and neither on cache state
    const auto c(slowFirst.compose(Pair, ZoomLevel(1)));
    cv::absdiff(a.image(), c.image(), diff);
    CHECK(cv::countNonZero(diff.reshape(1)) == 0);
    CHECK(slowFirst.http->requests() == 4);
}

TEST_CASE("missing tiles are filled uniformly", "[mosaic]")
{
    Fixture f;
    f.tile(1, 1000, 1000, Red);
    // 1001/1000 unknown to the fake server -> 404

    map::MosaicOptions mo;
    mo.missingTileColor = Green;

    const auto mosaic(f.compose(Pair, ZoomLevel(1), mo));
    CHECK(uniform(mosaic.image(), cv::Rect(0, 0, 256, 256), Red));
    CHECK(uniform(mosaic.image(), cv::Rect(256, 0, 256, 256), Green));

    // default fill is black
    const auto dflt(f.compose(Pair, ZoomLevel(1)));
    CHECK(uniform(dflt.image(), cv::Rect(256, 0, 256, 256), Color()));
}

TEST_CASE("unaligned rectangle is clipped from surrounding tiles", "[mosaic]")
{
    Fixture f;
    f.tile(2, 1000, 1000, Red);
    f.tile(2, 1002, 1000, Green);
    f.tile(2, 1000, 1002, Blue);
    f.tile(2, 1002, 1002, White);

    const GridRectangle rect(GridCoordinates(1001, 1001)
                             , GridCoordinates(1002, 1002));
    const auto mosaic(f.compose(rect, ZoomLevel(2)));
    REQUIRE(mosaic.width() == 256);
    REQUIRE(mosaic.height() == 256);

    // each quadrant (128 px = one region at zoom 2) comes from another tile
    CHECK(uniform(mosaic.image(), cv::Rect(0, 128, 128, 128), Red));
    CHECK(uniform(mosaic.image(), cv::Rect(128, 128, 128, 128), Green));
    CHECK(uniform(mosaic.image(), cv::Rect(0, 0, 128, 128), Blue));
    CHECK(uniform(mosaic.image(), cv::Rect(128, 0, 128, 128), White));
}

TEST_CASE("odd sized tiles are scaled", "[mosaic]")
{
    Fixture f;
    f.tile(1, 1000, 1000, Red, 0, 512);
    f.tile(1, 1001, 1000, Blue, 0, 128);

    const auto mosaic(f.compose(Pair, ZoomLevel(1)));
    CHECK(uniform(mosaic.image(), cv::Rect(0, 0, 256, 256), Red));
    CHECK(uniform(mosaic.image(), cv::Rect(256, 0, 256, 256), Blue));
}

TEST_CASE("missing regions are overpainted", "[mosaic]")
{
    Fixture f;
    f.tile(2, 1000, 1000, Red);
    f.region(1000, 1000, true);
    f.region(1001, 1000, true);
    f.region(1000, 1001, true);
    f.region(1001, 1001, false);

    const GridRectangle rect(GridCoordinates(1000, 1000)
                             , GridCoordinates(1001, 1001));

    map::MosaicOptions mo;
    mo.missingRegionColor = map::WaterColor;

    const auto mosaic(f.compose(rect, ZoomLevel(2), mo));
    CHECK(uniform(mosaic.image(), cv::Rect(128, 0, 128, 128)
                  , map::WaterColor));
    CHECK(uniform(mosaic.image(), cv::Rect(0, 0, 128, 128), Red));
    CHECK(uniform(mosaic.image(), cv::Rect(0, 128, 256, 128), Red));

    // no checks without color
    const auto before(f.http->requests());
    const auto plain(f.compose(rect, ZoomLevel(2)));
    CHECK(uniform(plain.image(), cv::Rect(0, 0, 256, 256), Red));
    CHECK(f.http->requests() == before + 1);
}

TEST_CASE("failed tile fails the mosaic unless tolerated", "[mosaic]")
{
    Fixture f;
    f.tile(1, 1000, 1000, Red);
    f.http->respond("http://tiles.test/1/1001/1000", test::response(503));

    CHECK_THROWS_AS(f.compose(Pair, ZoomLevel(1)), storage::TransientError);

    f.options.tolerateMissingTiles(true);
    map::MosaicOptions mo;
    mo.missingTileColor = Green;
    const auto mosaic(f.compose(Pair, ZoomLevel(1), mo));
    CHECK(uniform(mosaic.image(), cv::Rect(0, 0, 256, 256), Red));
    CHECK(uniform(mosaic.image(), cv::Rect(256, 0, 256, 256), Green));
}

TEST_CASE("unexpected status is never tolerated", "[mosaic]")
{
    Fixture f;
    f.options.tolerateMissingTiles(true);
    f.tile(1, 1000, 1000, Red);
    f.http->respond("http://tiles.test/1/1001/1000", test::response(401));

    CHECK_THROWS_AS(f.compose(Pair, ZoomLevel(1))
                    , storage::UnexpectedResponse);
}

TEST_CASE("compose interrupted before start throws", "[mosaic]")
{
    Fixture f;
    f.tile(1, 1000, 1000, Red);
    f.tile(1, 1001, 1000, Blue);

    map::Interrupt interrupt;
    interrupt.interrupt();
    CHECK_THROWS_AS(f.compose(Pair, ZoomLevel(1), map::MosaicOptions()
                              , &interrupt)
                    , storage::Interrupted);
}

TEST_CASE("compose interrupted while tiles are in flight", "[mosaic]")
{
    Fixture f;
    f.tile(1, 1000, 1000, Red, 500);

    const std::string url("http://tiles.test/1/1000/1000");
    const GridRectangle single(GridCoordinates(1000, 1000)
                               , GridCoordinates(1000, 1000));
    const map::TileId tileId(ZoomLevel(1), GridCoordinates(1000, 1000));

    map::Interrupt interrupt;
    {
        map::TileFetcher fetcher(f.cache, f.limiter, f.http, f.options);
        map::RegionResolver resolver(f.cache, f.limiter, f.http, f.options);

        // destroyed before fetcher and resolver: waits for running fetch
        map::ThreadPool pool(2);
        map::MosaicCompositor compositor(fetcher, resolver, pool, f.options);

        std::thread interrupter([&]()
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            interrupt.interrupt();
        });

        const auto start(std::chrono::steady_clock::now());
        CHECK_THROWS_AS(compositor.compose(single, ZoomLevel(1)
                                           , map::MosaicOptions()
                                           , &interrupt)
                        , storage::Interrupted);
        const auto elapsed(std::chrono::steady_clock::now() - start);
        interrupter.join();

        CHECK(elapsed < std::chrono::milliseconds(400));
        CHECK(f.http->requests(url) == 1);
    }

    // abandoned fetch still completed and populated the cache
    CHECK(f.cache.get(map::TileFetcher::cacheKey(tileId)));
    CHECK(f.http->requests(url) == 1);
}

TEST_CASE("mosaic descriptors", "[mosaic]")
{
    Fixture f;
    f.tile(1, 1000, 1000, Red);
    f.tile(1, 1001, 1000, Blue);

    const auto mosaic(f.compose(Pair, ZoomLevel(1)));
    CHECK(mosaic.aspectRatio() == Approx(2.0));
    CHECK(mosaic.ppsHudConfig() == "<256000,256000,0>/2/1/1");
    CHECK(mosaic.pixel(10, 10) == Red);

    const auto p(mosaic.position(GridCoordinates(1001, 1000)
                                 , map::RegionCoordinates(128, 64)));
    CHECK(p.x == Approx(384.0));
    CHECK(p.y == Approx(192.0));

    // extent rounded up to whole tiles at coarse zoom
    const GridRectangle three(GridCoordinates(1000, 1000)
                              , GridCoordinates(1002, 1000));
    const auto coarse(f.compose(three, ZoomLevel(2)));
    CHECK(coarse.width() == 512);
    CHECK(coarse.ppsHudConfig() == "<256000,256000,0>/4/2/1");
}
