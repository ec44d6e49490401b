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
#include <mutex>
#include <chrono>
#include <limits>
#include <vector>
#include <algorithm>

#include <boost/format.hpp>

#include <opencv2/imgproc/imgproc.hpp>
#include <opencv2/imgcodecs/imgcodecs.hpp>

#include "dbglog/dbglog.hpp"

#include "../storage/error.hpp"

#include "zoom.hpp"
#include "mosaic.hpp"

namespace slmaplibs { namespace map {

namespace {

const unsigned int GridMax(std::numeric_limits<GridIndex>::max());

/** Regions covered by mosaic of given rectangle at given zoom.
 */
GridRectangle mosaicExtent(const GridRectangle &rect, const ZoomLevel &zoom)
{
    const auto size(mosaicSize(rect, zoom));
    const auto ppr(zoom.pixelsPerRegion());
    const auto &ll(rect.lowerLeft());

    return GridRectangle
        (ll, GridCoordinates
         (std::min(GridMax, ll.x() + size.width / ppr - 1)
          , std::min(GridMax, ll.y() + size.height / ppr - 1)));
}

/** Pixel rectangle of given regions inside image of given extent.
 */
cv::Rect pixelRect(const GridRectangle &extent, const ZoomLevel &zoom
                   , int imageHeight, const GridRectangle &regions)
{
    const int ppr(zoom.pixelsPerRegion());
    const int x((regions.lowerLeft().x() - extent.lowerLeft().x()) * ppr);
    const int top((regions.upperRight().y() + 1 - extent.lowerLeft().y())
                  * ppr);
    return cv::Rect(x, imageHeight - top
                    , regions.width() * ppr, regions.height() * ppr);
}

/** Shared state of one compose run. Outlives the run when interrupted.
 */
struct Job {
    Job(const GridRectangle &extent, const ZoomLevel &zoom
        , const cv::Mat &image, const MosaicOptions &mosaicOptions
        , bool tolerate)
        : extent(extent), zoom(zoom), image(image)
        , mosaicOptions(mosaicOptions), tolerate(tolerate)
        , next(0), stop(false)
    {}

    const GridRectangle extent;
    const ZoomLevel zoom;
    cv::Mat image;
    const MosaicOptions mosaicOptions;
    const bool tolerate;

    std::vector<TileId> tiles;
    std::atomic<std::size_t> next;
    std::atomic<bool> stop;

    std::mutex mutex;
    std::exception_ptr error;

    void fail(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!error) { error = e; }
        stop = true;
    }
};

void placeTile(Job &job, const TileId &tileId, const Tile &tile)
{
    cv::Mat image(tile.image);
    if ((image.cols != int(TilePixels)) || (image.rows != int(TilePixels))) {
        LOG(warn1) << "Tile " << tileId << " has unexpected size "
                   << image.cols << "x" << image.rows << "; resizing.";
        cv::Mat resized;
        cv::resize(image, resized, cv::Size(TilePixels, TilePixels)
                   , 0.0, 0.0, cv::INTER_AREA);
        image = resized;
    }

    const auto dst(pixelRect(job.extent, job.zoom, job.image.rows
                             , tileId.rectangle()));
    // tile may stick out of the image when it is not aligned to the mosaic
    const auto clipped(dst & cv::Rect(0, 0, job.image.cols, job.image.rows));
    if (clipped.area() <= 0) { return; }

    const cv::Rect src(clipped.x - dst.x, clipped.y - dst.y
                       , clipped.width, clipped.height);
    image(src).copyTo(job.image(clipped));
}

void paintMissingRegions(Job &job, const TileId &tileId
                         , RegionResolver &resolver, const Color &color)
{
    const auto regions(intersect(tileId.rectangle(), job.extent));
    if (!regions) { return; }

    const auto &ll(regions->lowerLeft());
    const auto &ur(regions->upperRight());
    for (unsigned int y(ll.y()); y <= ur.y(); ++y) {
        for (unsigned int x(ll.x()); x <= ur.x(); ++x) {
            if (job.stop) { return; }

            const GridCoordinates gc(x, y);
            if (resolver.regionExists(gc)) { continue; }

            LOG(debug) << "Region " << gc << " does not exist.";
            const auto rect(pixelRect(job.extent, job.zoom, job.image.rows
                                      , GridRectangle(gc, gc)));
            cv::Mat(job.image, rect).setTo(scalar(color));
        }
    }
}

void runner(const std::shared_ptr<Job> &job, TileFetcher &fetcher
            , RegionResolver &resolver)
{
    for (;;) {
        if (job->stop) { return; }
        const auto index(job->next++);
        if (index >= job->tiles.size()) { return; }

        const auto &tileId(job->tiles[index]);

        try {
            const auto tile(fetcher.fetch(tileId));
            if (!tile.valid()) {
                LOG(info1) << "Tile " << tileId << " not available; "
                    "filling with " << job->mosaicOptions.missingTileColor
                           << ".";
                continue;
            }

            placeTile(*job, tileId, tile);

            if (job->mosaicOptions.missingRegionColor) {
                paintMissingRegions(*job, tileId, resolver
                                    , *job->mosaicOptions.missingRegionColor);
            }
        } catch (const storage::TransientError &e) {
            if (!job->tolerate) {
                job->fail(std::current_exception());
                return;
            }
            LOG(warn2) << "Unable to fetch tile " << tileId << " <"
                       << e.what() << ">; treating it as missing.";
        } catch (const std::exception&) {
            job->fail(std::current_exception());
            return;
        }
    }
}

} // namespace

Mosaic::Mosaic(const GridRectangle &rect, const ZoomLevel &zoom
               , const cv::Mat &image)
    : rect_(rect), zoom_(zoom), image_(image)
{}

unsigned int Mosaic::regionsX() const
{
    return image_.cols / zoom_.pixelsPerRegion();
}

unsigned int Mosaic::regionsY() const
{
    return image_.rows / zoom_.pixelsPerRegion();
}

Color Mosaic::pixel(int x, int y) const
{
    const auto &px(image_.at<cv::Vec3b>(y, x));
    return Color(px[2], px[1], px[0]);
}

cv::Point2d Mosaic::position(const GridCoordinates &region
                             , const RegionCoordinates &offset) const
{
    const auto &ll(rect_.lowerLeft());
    const double ppr(zoom_.pixelsPerRegion());
    const auto ppm(zoom_.pixelsPerMeter());

    return cv::Point2d
        ((double(region.x()) - ll.x()) * ppr + offset.x * ppm
         , image_.rows
         - ((double(region.y()) - ll.y()) * ppr + offset.y * ppm));
}

std::string Mosaic::ppsHudConfig() const
{
    const auto &ll(rect_.lowerLeft());
    return str(boost::format("<%d,%d,0>/%d/%d/1")
               % (unsigned(ll.x()) * 256) % (unsigned(ll.y()) * 256)
               % regionsX() % regionsY());
}

double Mosaic::aspectRatio() const
{
    return double(image_.cols) / image_.rows;
}

void Mosaic::write(const boost::filesystem::path &path) const
{
    bool ok(false);
    try {
        ok = cv::imwrite(path.string(), image_);
    } catch (const cv::Exception &e) {
        LOGTHROW(err2, storage::Error)
            << "Unable to write map image to " << path << ": <"
            << e.what() << ">.";
    }

    if (!ok) {
        LOGTHROW(err2, storage::Error)
            << "Unable to write map image to " << path << ".";
    }

    LOG(info2) << "Map image (" << image_.cols << "x" << image_.rows
               << ") written to " << path << ".";
}

Mosaic Mosaic::clone() const
{
    return Mosaic(rect_, zoom_, image_.clone());
}

MosaicCompositor::MosaicCompositor(TileFetcher &fetcher
                                   , RegionResolver &resolver
                                   , ThreadPool &pool
                                   , const Options &options)
    : fetcher_(fetcher), resolver_(resolver), pool_(pool)
    , options_(options)
{}

Mosaic MosaicCompositor::compose(const GridRectangle &rect
                                 , const ZoomLevel &zoom
                                 , const MosaicOptions &mosaicOptions
                                 , const Interrupt *interrupt) const
{
    auto interrupted([&]() { return interrupt && interrupt->interrupted(); });

    if (interrupted()) {
        LOGTHROW(err1, storage::Interrupted)
            << "Mosaic composition interrupted.";
    }

    const auto size(mosaicSize(rect, zoom));
    const auto extent(mosaicExtent(rect, zoom));

    auto job(std::make_shared<Job>
             (extent, zoom
              , cv::Mat(size.height, size.width, CV_8UC3
                        , scalar(mosaicOptions.missingTileColor))
              , mosaicOptions, options_.tolerateMissingTiles()));

    // every tile touching the extent
    const auto ts(zoom.tileSize());
    const auto origin(zoom.tileOrigin(extent.lowerLeft()));
    for (unsigned int y(origin.y()); y <= extent.upperRight().y(); y += ts) {
        for (unsigned int x(origin.x()); x <= extent.upperRight().x();
             x += ts)
        {
            job->tiles.push_back(TileId(zoom, GridCoordinates(x, y)));
        }
    }

    LOG(info2) << "Composing " << size << " mosaic of " << rect
               << " at zoom " << zoom << " from " << job->tiles.size()
               << " tiles.";

    const auto runners(std::min<std::size_t>
                       (std::max(options_.fanOut(), 1u), job->tiles.size()));

    std::vector<std::future<void>> futures;
    for (std::size_t i(0); i < runners; ++i) {
        auto &fetcher(fetcher_);
        auto &resolver(resolver_);
        futures.push_back(pool_.post([job, &fetcher, &resolver]()
        {
            runner(job, fetcher, resolver);
        }));
    }

    for (auto &future : futures) {
        while (future.wait_for(std::chrono::milliseconds(50))
               != std::future_status::ready)
        {
            if (interrupted()) {
                job->stop = true;
                LOGTHROW(err1, storage::Interrupted)
                    << "Mosaic composition interrupted.";
            }
        }
        future.get();
    }

    if (job->error) { std::rethrow_exception(job->error); }

    if (interrupted()) {
        LOGTHROW(err1, storage::Interrupted)
            << "Mosaic composition interrupted.";
    }

    return Mosaic(rect, zoom, job->image);
}

} } // namespace slmaplibs::map
