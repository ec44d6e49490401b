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
#include <algorithm>
#include <limits>
#include <iostream>

#include "dbglog/dbglog.hpp"

#include "../storage/error.hpp"

#include "types.hpp"

namespace slmaplibs { namespace map {

namespace {

const unsigned int GridMax(std::numeric_limits<GridIndex>::max());

int hexDigit(char c)
{
    if ((c >= '0') && (c <= '9')) { return c - '0'; }
    if ((c >= 'a') && (c <= 'f')) { return c - 'a' + 10; }
    if ((c >= 'A') && (c <= 'F')) { return c - 'A' + 10; }
    return -1;
}

} // namespace

GridRectangle::GridRectangle(const GridCoordinates &lowerLeft
                             , const GridCoordinates &upperRight)
    : ll_(lowerLeft), ur_(upperRight)
{
    if ((ll_.x() > ur_.x()) || (ll_.y() > ur_.y())) {
        LOGTHROW(err1, storage::InvalidRectangle)
            << "Invalid grid rectangle: lower left corner " << ll_
            << " is above or right of upper right corner " << ur_ << ".";
    }
}

GridRectangle GridRectangle::fromCorners(const GridCoordinates &a
                                         , const GridCoordinates &b)
{
    return GridRectangle
        (GridCoordinates(std::min(a.x(), b.x()), std::min(a.y(), b.y()))
         , GridCoordinates(std::max(a.x(), b.x()), std::max(a.y(), b.y())));
}

boost::optional<GridRectangle> intersect(const GridRectangle &a
                                         , const GridRectangle &b)
{
    const GridCoordinates ll
        (std::max(a.lowerLeft().x(), b.lowerLeft().x())
         , std::max(a.lowerLeft().y(), b.lowerLeft().y()));
    const GridCoordinates ur
        (std::min(a.upperRight().x(), b.upperRight().x())
         , std::min(a.upperRight().y(), b.upperRight().y()));

    if ((ll.x() > ur.x()) || (ll.y() > ur.y())) { return boost::none; }
    return GridRectangle(ll, ur);
}

boost::optional<GridRectangle>
boundingRectangle(const std::vector<GridCoordinates> &coordinates)
{
    if (coordinates.empty()) { return boost::none; }

    auto ll(coordinates.front());
    auto ur(coordinates.front());
    for (const auto &gc : coordinates) {
        ll = GridCoordinates(std::min(ll.x(), gc.x()), std::min(ll.y(), gc.y()));
        ur = GridCoordinates(std::max(ur.x(), gc.x()), std::max(ur.y(), gc.y()));
    }
    return GridRectangle(ll, ur);
}

ZoomLevel::ZoomLevel(int level)
    : level_(level)
{
    if ((level_ < min) || (level_ > max)) {
        LOGTHROW(err1, storage::Error)
            << "Zoom level " << level_ << " out of range [" << min
            << ", " << max << "].";
    }
}

ZoomLevel ZoomLevel::fromTileSize(unsigned int tileSize)
{
    for (int level(min); level <= max; ++level) {
        if ((1u << (level - 1)) == tileSize) { return ZoomLevel(level); }
    }
    LOGTHROW(err1, storage::Error)
        << "No zoom level with tile size " << tileSize << ".";
    return ZoomLevel();
}

std::vector<ZoomLevel> ZoomLevel::all()
{
    std::vector<ZoomLevel> levels;
    for (int level(min); level <= max; ++level) {
        levels.push_back(ZoomLevel(level));
    }
    return levels;
}

GridRectangle TileId::rectangle() const
{
    const auto last(zoom_.tileSize() - 1);
    return GridRectangle
        (origin_
         , GridCoordinates(std::min(GridMax, origin_.x() + last)
                           , std::min(GridMax, origin_.y() + last)));
}

Color Color::parse(const std::string &str)
{
    const auto bad([&]() {
        LOGTHROW(err1, storage::FormatError)
            << "Invalid color <" << str
            << ">, expected #rgb, #rrggbb or #rrggbbaa.";
    });

    if (str.empty() || (str[0] != '#')) { bad(); }

    std::vector<int> digits;
    for (auto i(str.begin() + 1), e(str.end()); i != e; ++i) {
        const auto d(hexDigit(*i));
        if (d < 0) { bad(); }
        digits.push_back(d);
    }

    switch (digits.size()) {
    case 3:
        return Color(digits[0] * 17, digits[1] * 17, digits[2] * 17);

    case 6: case 8:
        // alpha ignored
        return Color(digits[0] * 16 + digits[1]
                     , digits[2] * 16 + digits[3]
                     , digits[4] * 16 + digits[5]);

    default: break;
    }

    bad();
    return Color();
}

std::ostream& operator<<(std::ostream &os, const GridCoordinates &gc)
{
    return os << '(' << gc.x() << ", " << gc.y() << ')';
}

std::ostream& operator<<(std::ostream &os, const GridRectangle &rect)
{
    return os << rect.lowerLeft() << " - " << rect.upperRight();
}

std::ostream& operator<<(std::ostream &os, const ZoomLevel &zoom)
{
    return os << zoom.level();
}

std::ostream& operator<<(std::ostream &os, const TileId &tileId)
{
    return os << tileId.zoom() << '-' << tileId.origin().x()
              << '-' << tileId.origin().y();
}

std::ostream& operator<<(std::ostream &os, const Color &color)
{
    const char *hex("0123456789abcdef");
    return os << '#'
              << hex[color.r >> 4] << hex[color.r & 0xf]
              << hex[color.g >> 4] << hex[color.g & 0xf]
              << hex[color.b >> 4] << hex[color.b & 0xf];
}

std::istream& operator>>(std::istream &is, Color &color)
{
    std::string str;
    is >> str;
    if (!is) { return is; }

    try {
        color = Color::parse(str);
    } catch (const storage::FormatError&) {
        is.setstate(std::ios::failbit);
    }
    return is;
}

std::istream& operator>>(std::istream &is, GridRectangle &rect)
{
    unsigned int llx, lly, urx, ury;
    char c1, c2, c3;

    is >> llx >> c1 >> lly >> c2 >> urx >> c3 >> ury;
    if (!is) { return is; }

    if ((c1 != ',') || (c2 != ',') || (c3 != ',')
        || (llx > GridMax) || (lly > GridMax)
        || (urx > GridMax) || (ury > GridMax))
    {
        is.setstate(std::ios::failbit);
        return is;
    }

    try {
        rect = GridRectangle(GridCoordinates(llx, lly)
                             , GridCoordinates(urx, ury));
    } catch (const storage::InvalidRectangle&) {
        is.setstate(std::ios::failbit);
    }
    return is;
}

} } // namespace slmaplibs::map
