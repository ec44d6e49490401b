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
#include <iostream>

#include "dbglog/dbglog.hpp"

#include "zoom.hpp"

namespace slmaplibs { namespace map {

namespace {

inline unsigned int tiles(unsigned int regions, unsigned int tileSize)
{
    return (regions + tileSize - 1) / tileSize;
}

} // namespace

MosaicSize mosaicSize(const GridRectangle &rect, const ZoomLevel &zoom)
{
    const auto ts(zoom.tileSize());
    return MosaicSize(tiles(rect.width(), ts) * TilePixels
                      , tiles(rect.height(), ts) * TilePixels);
}

ZoomSelection selectZoom(const GridRectangle &rect
                         , unsigned int maxWidth, unsigned int maxHeight)
{
    ZoomSelection selection;

    for (const auto &zoom : ZoomLevel::all()) {
        const auto size(mosaicSize(rect, zoom));
        selection.zoom = zoom;
        selection.size = size;
        if ((size.width <= maxWidth) && (size.height <= maxHeight)) {
            selection.fits = true;
            break;
        }
    }

    if (selection.fits) {
        LOG(info1) << "Rectangle " << rect << " fits into " << maxWidth
                   << "x" << maxHeight << " at zoom " << selection.zoom
                   << " (" << selection.size << ").";
    } else {
        LOG(warn2) << "Rectangle " << rect << " does not fit into "
                   << maxWidth << "x" << maxHeight
                   << " at any zoom level; using coarsest zoom "
                   << selection.zoom << " (" << selection.size << ").";
    }

    return selection;
}

std::ostream& operator<<(std::ostream &os, const MosaicSize &size)
{
    return os << size.width << "x" << size.height;
}

} } // namespace slmaplibs::map
