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
 * \file map/mosaic.hpp
 *
 * Composition of map tiles into a single image.
 */

#ifndef slmaplibs_map_mosaic_hpp_included_
#define slmaplibs_map_mosaic_hpp_included_

#include <atomic>
#include <string>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include <opencv2/core/core.hpp>

#include "types.hpp"
#include "options.hpp"
#include "tilefetcher.hpp"
#include "regionresolver.hpp"
#include "threadpool.hpp"

namespace slmaplibs { namespace map {

/** Map image of a grid rectangle at given zoom level.
 *
 *  Lower left image corner is the south-west corner of the rectangle's
 *  lower left region. Image is rounded up to whole tiles therefore it can
 *  extend beyond the rectangle to the north and east.
 */
class Mosaic {
public:
    Mosaic(const GridRectangle &rect, const ZoomLevel &zoom
           , const cv::Mat &image);

    const GridRectangle& rectangle() const { return rect_; }
    const ZoomLevel& zoom() const { return zoom_; }

    /** 8-bit BGR image.
     */
    const cv::Mat& image() const { return image_; }
    cv::Mat& image() { return image_; }

    int width() const { return image_.cols; }
    int height() const { return image_.rows; }

    /** Number of regions covered by the image in each direction.
     */
    unsigned int regionsX() const;
    unsigned int regionsY() const;

    /** Color at given pixel; y grows downwards (southwards).
     */
    Color pixel(int x, int y) const;

    /** Pixel position of given point. Y grows downwards.
     */
    cv::Point2d position(const GridCoordinates &region
                         , const RegionCoordinates &offset
                         = RegionCoordinates()) const;

    /** PPS HUD configuration:
     *  "<llx*256,lly*256,0>/<regionsX>/<regionsY>/1".
     */
    std::string ppsHudConfig() const;

    /** width / height
     */
    double aspectRatio() const;

    /** Writes image to file; format is derived from the extension.
     */
    void write(const boost::filesystem::path &path) const;

    /** Deep copy.
     */
    Mosaic clone() const;

private:
    GridRectangle rect_;
    ZoomLevel zoom_;
    cv::Mat image_;
};

struct MosaicOptions {
    /** Fill of tiles the tile service does not have.
     */
    Color missingTileColor;

    /** Fill of regions that do not exist; unset disables the check.
     */
    boost::optional<Color> missingRegionColor;

    MosaicOptions() {}
};

/** Cancellation flag shared between a running compose and its caller.
 */
class Interrupt : boost::noncopyable {
public:
    Interrupt() : flag_(false) {}

    void interrupt() { flag_ = true; }
    bool interrupted() const { return flag_; }

private:
    std::atomic<bool> flag_;
};

/** Builds mosaics from tiles fetched in parallel.
 *
 *  Fetcher, resolver and pool must outlive any compose call including
 *  interrupted ones.
 */
class MosaicCompositor : boost::noncopyable {
public:
    MosaicCompositor(TileFetcher &fetcher, RegionResolver &resolver
                     , ThreadPool &pool, const Options &options = Options());

    /** Composes mosaic of given rectangle at given zoom.
     *
     *  Result does not depend on tile arrival order nor on cache state.
     *
     *  \throws storage::Interrupted when interrupted
     *  \throws any tile fetch error unless tolerated
     */
    Mosaic compose(const GridRectangle &rect, const ZoomLevel &zoom
                   , const MosaicOptions &mosaicOptions = MosaicOptions()
                   , const Interrupt *interrupt = nullptr) const;

private:
    TileFetcher &fetcher_;
    RegionResolver &resolver_;
    ThreadPool &pool_;
    const Options options_;
};

/** OpenCV (BGR) scalar of given color.
 */
inline cv::Scalar scalar(const Color &color) {
    return cv::Scalar(color.b, color.g, color.r);
}

} } // namespace slmaplibs::map

#endif // slmaplibs_map_mosaic_hpp_included_
