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
 * \file map/zoom.hpp
 *
 * Level of detail selection.
 */

#ifndef slmaplibs_map_zoom_hpp_included_
#define slmaplibs_map_zoom_hpp_included_

#include <iosfwd>

#include "types.hpp"

namespace slmaplibs { namespace map {

/** Pixel size of a mosaic.
 */
struct MosaicSize {
    unsigned int width;
    unsigned int height;

    MosaicSize(unsigned int width = 0, unsigned int height = 0)
        : width(width), height(height) {}
};

/** Size of mosaic covering given rectangle at given zoom. Each axis is
 *  rounded up to whole tiles.
 */
MosaicSize mosaicSize(const GridRectangle &rect, const ZoomLevel &zoom);

struct ZoomSelection {
    ZoomLevel zoom;
    MosaicSize size;

    /** False if even the coarsest level exceeds requested bounds.
     */
    bool fits;

    ZoomSelection() : fits(false) {}
};

/** Selects the most detailed zoom level whose mosaic fits into
 *  maxWidth x maxHeight pixels. Falls back to the coarsest level (with
 *  fits == false) if no level fits.
 */
ZoomSelection selectZoom(const GridRectangle &rect
                         , unsigned int maxWidth, unsigned int maxHeight);

std::ostream& operator<<(std::ostream &os, const MosaicSize &size);

} } // namespace slmaplibs::map

#endif // slmaplibs_map_zoom_hpp_included_
