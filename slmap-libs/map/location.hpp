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
 * \file map/location.hpp
 *
 * Textual location: "Region Name/x/y/z".
 */

#ifndef slmaplibs_map_location_hpp_included_
#define slmaplibs_map_location_hpp_included_

#include <string>
#include <iosfwd>

#include "types.hpp"

namespace slmaplibs { namespace map {

/** Named region plus position inside it.
 */
struct Location {
    std::string region;
    RegionCoordinates position;

    Location() {}
    Location(const std::string &region
             , const RegionCoordinates &position = RegionCoordinates())
        : region(region), position(position) {}

    /** Parses "Region Name/x/y/z"; name may be URL-encoded
     *  (e.g. "Da%20Boom/128/128/22"). Position components are optional
     *  and default to the region center at ground level.
     *
     *  Throws storage::FormatError on malformed input.
     */
    static Location parse(const std::string &str);
};

std::ostream& operator<<(std::ostream &os, const Location &location);

} } // namespace slmaplibs::map

#endif // slmaplibs_map_location_hpp_included_
