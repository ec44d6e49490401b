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
#include <catch2/catch.hpp>

#include "slmap-libs/map/zoom.hpp"

namespace map = slmaplibs::map;

using map::GridCoordinates;
using map::GridRectangle;
using map::ZoomLevel;

TEST_CASE("mosaic size is rounded up to whole tiles", "[zoom]")
{
    const GridRectangle rect(GridCoordinates(1000, 1000)
                             , GridCoordinates(1002, 1000));
    const auto s1(map::mosaicSize(rect, ZoomLevel(1)));
    CHECK(s1.width == 768);
    CHECK(s1.height == 256);

    const auto s2(map::mosaicSize(rect, ZoomLevel(2)));
    CHECK(s2.width == 512);
    CHECK(s2.height == 256);
}

TEST_CASE("most detailed fitting zoom is selected", "[zoom]")
{
    const GridRectangle single(GridCoordinates(1000, 1000)
                               , GridCoordinates(1000, 1000));
    auto sel(map::selectZoom(single, 256, 256));
    CHECK(sel.fits);
    CHECK(sel.zoom == ZoomLevel(1));
    CHECK(sel.size.width == 256);

    const GridRectangle square(GridCoordinates(1000, 1000)
                               , GridCoordinates(1001, 1001));
    sel = map::selectZoom(square, 256, 256);
    CHECK(sel.fits);
    CHECK(sel.zoom == ZoomLevel(2));

    // height limits
    sel = map::selectZoom(square, 4096, 256);
    CHECK(sel.zoom == ZoomLevel(2));

    sel = map::selectZoom(square, 512, 512);
    CHECK(sel.zoom == ZoomLevel(1));
    CHECK(sel.size.width == 512);
    CHECK(sel.size.height == 512);
}

TEST_CASE("coarsest zoom when nothing fits", "[zoom]")
{
    const GridRectangle rect(GridCoordinates(380, 380)
                             , GridCoordinates(1500, 1500));
    CHECK(rect.width() == 1121);

    const auto sel(map::selectZoom(rect, 2048, 2048));
    CHECK_FALSE(sel.fits);
    CHECK(sel.zoom == ZoomLevel(8));
    CHECK(sel.size.width == 2304);
    CHECK(sel.size.height == 2304);

    const auto larger(map::selectZoom(rect, 2304, 2304));
    CHECK(larger.fits);
    CHECK(larger.zoom == ZoomLevel(8));
}
