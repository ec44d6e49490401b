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
#include <boost/program_options.hpp>

#include "options.hpp"

namespace po = boost::program_options;

namespace slmaplibs { namespace map {

void Options::configuration(po::options_description &od
                            , const std::string &prefix)
{
    od.add_options()
        ((prefix + "io.retries").c_str()
         , po::value(&ioRetries_)->default_value(ioRetries_)
         , "Max number of retries of failed remote request "
         "(-1 means infinity retries).")
        ((prefix + "io.retryDelay").c_str()
         , po::value(&ioRetryDelay_)->default_value(ioRetryDelay_)
         , "Delay before first retry [in ms]; doubled after each "
         "failed retry. Zero means immediate retry!")
        ((prefix + "io.wait").c_str()
         , po::value(&ioWait_)->default_value(ioWait_)
         , "Timeout for remote requests [in ms] (-1 means infinity).")
        ((prefix + "tiles.url").c_str()
         , po::value(&tileUrl_)->default_value(tileUrl_)
         , "Map tile URL template; receives zoom level, x and y "
         "(boost::format syntax).")
        ((prefix + "tiles.absentTtl").c_str()
         , po::value(&absentTtl_)->default_value(absentTtl_)
         , "How long [in s] to remember that a tile does not exist when "
         "the server does not say.")
        ((prefix + "regions.byNameUrl").c_str()
         , po::value(&regionByNameUrl_)->default_value(regionByNameUrl_)
         , "Region name to grid coordinates lookup service URL.")
        ((prefix + "regions.byCoordsUrl").c_str()
         , po::value(&regionByCoordsUrl_)->default_value(regionByCoordsUrl_)
         , "Grid coordinates to region name lookup service URL.")
        ((prefix + "regions.lruCapacity").c_str()
         , po::value(&lruCapacity_)->default_value(lruCapacity_)
         , "Number of region lookups kept in memory.")
        ((prefix + "throttle.rate").c_str()
         , po::value(&throttleRate_)->default_value(throttleRate_)
         , "Max number of remote requests per second "
         "(zero or negative disables throttling).")
        ((prefix + "throttle.burst").c_str()
         , po::value(&throttleBurst_)->default_value(throttleBurst_)
         , "Number of remote requests allowed to pass at once.")
        ((prefix + "mosaic.fanOut").c_str()
         , po::value(&fanOut_)->default_value(fanOut_)
         , "Max number of tiles fetched concurrently by one mosaic.")
        ((prefix + "mosaic.tolerateMissingTiles").c_str()
         , po::value(&tolerateMissingTiles_)
         ->default_value(tolerateMissingTiles_)->implicit_value(true)
         , "Treat tiles that failed to download as missing instead of "
         "failing the whole mosaic.")
        ;
}

void Options::configure(const po::variables_map &vars
                        , const std::string &prefix)
{
    const auto name(prefix + "mosaic.fanOut");
    if (vars.count(name) && !fanOut_) {
        throw po::validation_error
            (po::validation_error::invalid_option_value, name);
    }
}

std::ostream& Options::dump(std::ostream &os, const std::string &prefix)
    const
{
    os << prefix << "io.retries = " << ioRetries_ << '\n'
       << prefix << "io.retryDelay = " << ioRetryDelay_ << '\n'
       << prefix << "io.wait = " << ioWait_ << '\n'
       << prefix << "tiles.url = " << tileUrl_ << '\n'
       << prefix << "tiles.absentTtl = " << absentTtl_ << '\n'
       << prefix << "regions.byNameUrl = " << regionByNameUrl_ << '\n'
       << prefix << "regions.byCoordsUrl = " << regionByCoordsUrl_ << '\n'
       << prefix << "regions.lruCapacity = " << lruCapacity_ << '\n'
       << prefix << "throttle.rate = " << throttleRate_ << '\n'
       << prefix << "throttle.burst = " << throttleBurst_ << '\n'
       << prefix << "mosaic.fanOut = " << fanOut_ << '\n'
       << prefix << "mosaic.tolerateMissingTiles = "
       << std::boolalpha << tolerateMissingTiles_ << std::noboolalpha
       << '\n';
    return os;
}

} } // namespace slmaplibs::map
