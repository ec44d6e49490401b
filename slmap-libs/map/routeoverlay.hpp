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
 * \file map/routeoverlay.hpp
 *
 * Route drawing on top of a mosaic.
 */

#ifndef slmaplibs_map_routeoverlay_hpp_included_
#define slmaplibs_map_routeoverlay_hpp_included_

#include <vector>

#include <boost/optional.hpp>

#include <opencv2/core/core.hpp>

#include "types.hpp"
#include "mosaic.hpp"

namespace slmaplibs { namespace map {

struct OverlayOptions {
    /** Route line thickness in pixels.
     */
    int lineThickness;

    /** Waypoint marker radius in pixels.
     */
    int markerRadius;

    /** Number of curve samples between two consecutive waypoints.
     */
    int samplesPerSegment;

    OverlayOptions()
        : lineThickness(2), markerRadius(4), samplesPerSegment(16)
    {}
};

struct OverlayResult {
    /** Mosaic with route drawn over it.
     */
    Mosaic withRoute;

    /** Untouched mosaic, only if asked for.
     */
    boost::optional<Mosaic> withoutRoute;

    OverlayResult(const Mosaic &withRoute) : withRoute(withRoute) {}
};

/** Draws route over a copy of given mosaic.
 *
 *  Two or more waypoints produce a smooth curve (Catmull-Rom spline)
 *  passing through every waypoint plus a marker at each waypoint; single
 *  waypoint produces just the marker. Input mosaic is left untouched.
 *
 *  \throws storage::Error when route has no waypoint
 */
OverlayResult drawRoute(const Mosaic &mosaic, const Route &route
                        , const OverlayOptions &options = OverlayOptions()
                        , bool keepWithoutRoute = false);

/** Samples Catmull-Rom spline passing through all given points (in order).
 *  Returns input for less than 2 points.
 */
std::vector<cv::Point2d>
catmullRom(const std::vector<cv::Point2d> &points, int samplesPerSegment);

} } // namespace slmaplibs::map

#endif // slmaplibs_map_routeoverlay_hpp_included_
