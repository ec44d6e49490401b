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
 * \file map/types.hpp
 *
 * Grid map data model: grid coordinates, rectangles, zoom levels, tile IDs
 * and routes.
 */

#ifndef slmaplibs_map_types_hpp_included_
#define slmaplibs_map_types_hpp_included_

#include <cstdint>
#include <string>
#include <vector>
#include <iosfwd>

#include <boost/optional.hpp>

namespace slmaplibs { namespace map {

/** Size of a tile image edge in pixels (at any zoom level).
 */
const unsigned int TilePixels(256);

/** Size of a region edge in meters.
 */
const double RegionSize(256.0);

typedef std::uint16_t GridIndex;

/** Position of a region in the grid. X grows eastwards, Y northwards.
 */
class GridCoordinates {
public:
    GridCoordinates(GridIndex x = 0, GridIndex y = 0) : x_(x), y_(y) {}

    GridIndex x() const { return x_; }
    GridIndex y() const { return y_; }

    bool operator==(const GridCoordinates &o) const {
        return (x_ == o.x_) && (y_ == o.y_);
    }
    bool operator!=(const GridCoordinates &o) const { return !(*this == o); }
    bool operator<(const GridCoordinates &o) const {
        if (x_ < o.x_) { return true; }
        if (o.x_ < x_) { return false; }
        return y_ < o.y_;
    }

private:
    GridIndex x_;
    GridIndex y_;
};

/** Inclusive rectangle of regions.
 *
 *  Invariant: lowerLeft is not above or right of upperRight.
 */
class GridRectangle {
public:
    GridRectangle() {}

    /** Throws storage::InvalidRectangle if lowerLeft is above or right of
     *  upperRight.
     */
    GridRectangle(const GridCoordinates &lowerLeft
                  , const GridCoordinates &upperRight);

    /** Builds rectangle from any two opposite corners.
     */
    static GridRectangle fromCorners(const GridCoordinates &a
                                     , const GridCoordinates &b);

    const GridCoordinates& lowerLeft() const { return ll_; }
    const GridCoordinates& upperRight() const { return ur_; }

    /** Number of regions in X direction.
     */
    unsigned int width() const { return ur_.x() - ll_.x() + 1; }

    /** Number of regions in Y direction.
     */
    unsigned int height() const { return ur_.y() - ll_.y() + 1; }

    bool contains(const GridCoordinates &gc) const {
        return ((ll_.x() <= gc.x()) && (gc.x() <= ur_.x())
                && (ll_.y() <= gc.y()) && (gc.y() <= ur_.y()));
    }

    bool operator==(const GridRectangle &o) const {
        return (ll_ == o.ll_) && (ur_ == o.ur_);
    }
    bool operator!=(const GridRectangle &o) const { return !(*this == o); }

private:
    GridCoordinates ll_;
    GridCoordinates ur_;
};

/** Intersection of two rectangles, none if disjoint.
 */
boost::optional<GridRectangle> intersect(const GridRectangle &a
                                         , const GridRectangle &b);

/** Smallest rectangle containing all given coordinates, none if empty.
 */
boost::optional<GridRectangle>
boundingRectangle(const std::vector<GridCoordinates> &coordinates);

/** Map tile zoom level: 1 (most detailed) .. 8 (coarsest).
 *
 *  Tile at level l covers 2^(l-1) regions per edge.
 */
class ZoomLevel {
public:
    static const int min = 1;
    static const int max = 8;

    /** Throws storage::Error for level outside of [min, max].
     */
    explicit ZoomLevel(int level = min);

    /** Zoom level for given tile size in regions (power of two).
     */
    static ZoomLevel fromTileSize(unsigned int tileSize);

    /** All levels, most detailed first.
     */
    static std::vector<ZoomLevel> all();

    int level() const { return level_; }

    /** Number of regions covered by one tile edge.
     */
    unsigned int tileSize() const { return 1u << (level_ - 1); }

    unsigned int pixelsPerRegion() const { return TilePixels / tileSize(); }

    double pixelsPerMeter() const {
        return TilePixels / (tileSize() * RegionSize);
    }

    /** Lower left corner of the tile containing given region.
     */
    GridCoordinates tileOrigin(const GridCoordinates &gc) const {
        const auto ts(tileSize());
        return GridCoordinates(gc.x() - (gc.x() % ts), gc.y() - (gc.y() % ts));
    }

    bool operator==(const ZoomLevel &o) const { return level_ == o.level_; }
    bool operator!=(const ZoomLevel &o) const { return level_ != o.level_; }
    bool operator<(const ZoomLevel &o) const { return level_ < o.level_; }

private:
    int level_;
};

/** Identifies one fetchable tile.
 */
class TileId {
public:
    /** Tile at given zoom containing region gc.
     */
    TileId(const ZoomLevel &zoom = ZoomLevel()
           , const GridCoordinates &gc = GridCoordinates())
        : zoom_(zoom), origin_(zoom.tileOrigin(gc))
    {}

    const ZoomLevel& zoom() const { return zoom_; }
    const GridCoordinates& origin() const { return origin_; }

    /** Regions covered by this tile. Clamped at the grid edge.
     */
    GridRectangle rectangle() const;

    bool operator==(const TileId &o) const {
        return (zoom_ == o.zoom_) && (origin_ == o.origin_);
    }
    bool operator<(const TileId &o) const {
        if (zoom_ < o.zoom_) { return true; }
        if (o.zoom_ < zoom_) { return false; }
        return origin_ < o.origin_;
    }

private:
    ZoomLevel zoom_;
    GridCoordinates origin_;
};

/** Position inside a region, in meters from its south-west corner.
 */
struct RegionCoordinates {
    double x;
    double y;
    double z;

    RegionCoordinates(double x = 0.0, double y = 0.0, double z = 0.0)
        : x(x), y(y), z(z) {}
};

struct Color {
    std::uint8_t r;
    std::uint8_t g;
    std::uint8_t b;

    Color(std::uint8_t r = 0, std::uint8_t g = 0, std::uint8_t b = 0)
        : r(r), g(g), b(b) {}

    bool operator==(const Color &o) const {
        return (r == o.r) && (g == o.g) && (b == o.b);
    }
    bool operator!=(const Color &o) const { return !(*this == o); }

    /** Parses #rgb, #rrggbb or #rrggbbaa (alpha is ignored).
     *  Throws storage::FormatError on malformed input.
     */
    static Color parse(const std::string &str);
};

/** Default fill for missing regions: open water.
 */
const Color WaterColor(0x1d, 0x47, 0x5f);

struct Waypoint {
    GridCoordinates region;
    RegionCoordinates position;

    Waypoint(const GridCoordinates &region = GridCoordinates()
             , const RegionCoordinates &position = RegionCoordinates())
        : region(region), position(position) {}
};

/** Ordered list of waypoints (duplicates allowed) with draw color.
 */
struct Route {
    std::vector<Waypoint> waypoints;
    Color color;

    Route(const Color &color = Color(0xff, 0, 0)) : color(color) {}
};

std::ostream& operator<<(std::ostream &os, const GridCoordinates &gc);
std::ostream& operator<<(std::ostream &os, const GridRectangle &rect);
std::ostream& operator<<(std::ostream &os, const ZoomLevel &zoom);
std::ostream& operator<<(std::ostream &os, const TileId &tileId);
std::ostream& operator<<(std::ostream &os, const Color &color);

/** Reads color in any format accepted by Color::parse.
 */
std::istream& operator>>(std::istream &is, Color &color);

/** Reads rectangle as "llx,lly,urx,ury".
 */
std::istream& operator>>(std::istream &is, GridRectangle &rect);

} } // namespace slmaplibs::map

#endif // slmaplibs_map_types_hpp_included_
