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
#include <cmath>
#include <algorithm>

#include <opencv2/imgproc/imgproc.hpp>

#include "dbglog/dbglog.hpp"

#include "../storage/error.hpp"

#include "routeoverlay.hpp"

namespace slmaplibs { namespace map {

namespace {

// fixed point shift used for sub-pixel drawing
const int DrawShift(4);
const double DrawScale(1 << DrawShift);

cv::Point fixedPoint(const cv::Point2d &p)
{
    return cv::Point(int(std::round(p.x * DrawScale))
                     , int(std::round(p.y * DrawScale)));
}

cv::Point2d segmentPoint(const cv::Point2d &p0, const cv::Point2d &p1
                         , const cv::Point2d &p2, const cv::Point2d &p3
                         , double t)
{
    const auto t2(t * t);
    const auto t3(t2 * t);

    return 0.5 * ((2.0 * p1)
                  + (p2 - p0) * t
                  + (2.0 * p0 - 5.0 * p1 + 4.0 * p2 - p3) * t2
                  + (3.0 * p1 - p0 - 3.0 * p2 + p3) * t3);
}

} // namespace

std::vector<cv::Point2d>
catmullRom(const std::vector<cv::Point2d> &points, int samplesPerSegment)
{
    if (points.size() < 2) { return points; }
    samplesPerSegment = std::max(samplesPerSegment, 1);

    std::vector<cv::Point2d> curve;
    const auto last(points.size() - 1);

    for (std::size_t i(0); i < last; ++i) {
        // end points are duplicated to make the curve reach them
        const auto &p0(points[i ? i - 1 : 0]);
        const auto &p1(points[i]);
        const auto &p2(points[i + 1]);
        const auto &p3(points[std::min(i + 2, last)]);

        for (int s(0); s < samplesPerSegment; ++s) {
            curve.push_back(segmentPoint(p0, p1, p2, p3
                                         , double(s) / samplesPerSegment));
        }
    }
    curve.push_back(points.back());

    return curve;
}

OverlayResult drawRoute(const Mosaic &mosaic, const Route &route
                        , const OverlayOptions &options
                        , bool keepWithoutRoute)
{
    if (route.waypoints.empty()) {
        LOGTHROW(err1, storage::Error)
            << "Cannot draw route without waypoints.";
    }

    OverlayResult result(mosaic.clone());
    if (keepWithoutRoute) { result.withoutRoute = mosaic; }

    auto &image(result.withRoute.image());
    const auto color(scalar(route.color));

    std::vector<cv::Point2d> points;
    for (const auto &waypoint : route.waypoints) {
        points.push_back(mosaic.position(waypoint.region
                                         , waypoint.position));
    }

    if (points.size() > 1) {
        std::vector<cv::Point> curve;
        for (const auto &p : catmullRom(points, options.samplesPerSegment)) {
            curve.push_back(fixedPoint(p));
        }

        const cv::Point *pts(curve.data());
        const int npts(curve.size());
        cv::polylines(image, &pts, &npts, 1, false, color
                      , options.lineThickness, cv::LINE_AA, DrawShift);
    }

    for (const auto &p : points) {
        cv::circle(image, fixedPoint(p)
                   , int(options.markerRadius * DrawScale), color
                   , cv::FILLED, cv::LINE_AA, DrawShift);
    }

    LOG(info1) << "Drawn route of " << route.waypoints.size()
               << " waypoints over " << mosaic.width() << "x"
               << mosaic.height() << " map.";

    return result;
}

} } // namespace slmaplibs::map
