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
#include <vector>
#include <iostream>

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/uri.hpp"

#include "../storage/error.hpp"

#include "location.hpp"

namespace ba = boost::algorithm;

namespace slmaplibs { namespace map {

Location Location::parse(const std::string &str)
{
    std::vector<std::string> parts;
    ba::split(parts, str, ba::is_any_of("/"));

    if (parts.empty() || (parts.size() > 4)) {
        LOGTHROW(err1, storage::FormatError)
            << "Invalid location <" << str
            << ">, expected Region Name/x/y/z.";
    }

    Location location
        (ba::trim_copy(utility::urlDecode(parts[0]))
         , RegionCoordinates(RegionSize / 2, RegionSize / 2, 0.0));

    if (location.region.empty()) {
        LOGTHROW(err1, storage::FormatError)
            << "Invalid location <" << str << ">: empty region name.";
    }

    double *components[] = {
        &location.position.x, &location.position.y, &location.position.z
    };

    for (std::size_t i(1); i < parts.size(); ++i) {
        try {
            *components[i - 1]
                = boost::lexical_cast<double>(ba::trim_copy(parts[i]));
        } catch (const boost::bad_lexical_cast&) {
            LOGTHROW(err1, storage::FormatError)
                << "Invalid location <" << str << ">: bad coordinate <"
                << parts[i] << ">.";
        }
    }

    return location;
}

std::ostream& operator<<(std::ostream &os, const Location &location)
{
    return os << location.region << '/' << location.position.x
              << '/' << location.position.y << '/' << location.position.z;
}

} } // namespace slmaplibs::map
