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
 * \file map/options.hpp
 *
 * Map access options.
 */

#ifndef slmaplibs_map_options_hpp_included_
#define slmaplibs_map_options_hpp_included_

#include <string>
#include <iostream>

#include <boost/program_options.hpp>

namespace slmaplibs { namespace map {

/** Options shared by tile fetcher, region resolver and mosaic compositor.
 *
 *  Available options:
 *      io.*: remote access retries and timeouts
 *      tiles.*: tile service location and known-absent marker lifetime
 *      regions.*: region lookup service location and memory cache size
 *      throttle.*: outbound request rate limit
 *      mosaic.*: compositor fan-out and missing tile policy
 */
class Options {
public:
    Options()
        : ioRetries_(3)
        , ioRetryDelay_(500) // 500 ms
        , ioWait_(30000) // 30 s
        , tileUrl_("https://secondlife-maps-cdn.akamaized.net"
                   "/map-%d-%d-%d-objects.jpg")
        , absentTtl_(86400) // 1 day
        , regionByNameUrl_("https://cap.secondlife.com/cap/0"
                           "/d661249b-2b5a-4436-966a-3d3b8d7a574f")
        , regionByCoordsUrl_("https://cap.secondlife.com/cap/0"
                             "/b713fe80-283b-4585-af4d-a3b7d9a32492")
        , lruCapacity_(4096)
        , throttleRate_(10.0)
        , throttleBurst_(1)
        , fanOut_(8)
        , tolerateMissingTiles_(false)
    {}

    int ioRetries() const { return ioRetries_; }
    Options& ioRetries(int ioRetries) {
        ioRetries_ = ioRetries; return *this;
    }

    unsigned long ioRetryDelay() const { return ioRetryDelay_; }
    Options& ioRetryDelay(unsigned long ioRetryDelay) {
        ioRetryDelay_ = ioRetryDelay; return *this;
    }

    long ioWait() const { return ioWait_; }
    Options& ioWait(long ioWait) {
        ioWait_ = ioWait; return *this;
    }

    /** Tile URL template, takes zoom level, x and y.
     */
    const std::string& tileUrl() const { return tileUrl_; }
    Options& tileUrl(const std::string &tileUrl) {
        tileUrl_ = tileUrl; return *this;
    }

    /** Lifetime of known-absent marker [s] when the server gives none.
     */
    unsigned long absentTtl() const { return absentTtl_; }
    Options& absentTtl(unsigned long absentTtl) {
        absentTtl_ = absentTtl; return *this;
    }

    const std::string& regionByNameUrl() const { return regionByNameUrl_; }
    Options& regionByNameUrl(const std::string &regionByNameUrl) {
        regionByNameUrl_ = regionByNameUrl; return *this;
    }

    const std::string& regionByCoordsUrl() const { return regionByCoordsUrl_; }
    Options& regionByCoordsUrl(const std::string &regionByCoordsUrl) {
        regionByCoordsUrl_ = regionByCoordsUrl; return *this;
    }

    std::size_t lruCapacity() const { return lruCapacity_; }
    Options& lruCapacity(std::size_t lruCapacity) {
        lruCapacity_ = lruCapacity; return *this;
    }

    double throttleRate() const { return throttleRate_; }
    Options& throttleRate(double throttleRate) {
        throttleRate_ = throttleRate; return *this;
    }

    unsigned int throttleBurst() const { return throttleBurst_; }
    Options& throttleBurst(unsigned int throttleBurst) {
        throttleBurst_ = throttleBurst; return *this;
    }

    unsigned int fanOut() const { return fanOut_; }
    Options& fanOut(unsigned int fanOut) {
        fanOut_ = fanOut; return *this;
    }

    bool tolerateMissingTiles() const { return tolerateMissingTiles_; }
    Options& tolerateMissingTiles(bool tolerateMissingTiles) {
        tolerateMissingTiles_ = tolerateMissingTiles; return *this;
    }

    void configuration(boost::program_options::options_description &od
                       , const std::string &prefix = "");

    void configure(const boost::program_options::variables_map &vars
                   , const std::string &prefix = "");

    std::ostream& dump(std::ostream &os, const std::string &prefix = "") const;

private:
    /** Number of retries of transient failures, -1 means infinity.
     */
    int ioRetries_;

    /** Initial delay between retries [ms]. Doubled after each failure.
     */
    unsigned long ioRetryDelay_;

    /** Request timeout [ms], -1 means infinity.
     */
    long ioWait_;

    std::string tileUrl_;
    unsigned long absentTtl_;
    std::string regionByNameUrl_;
    std::string regionByCoordsUrl_;
    std::size_t lruCapacity_;
    double throttleRate_;
    unsigned int throttleBurst_;
    unsigned int fanOut_;
    bool tolerateMissingTiles_;
};

} } // namespace slmaplibs::map

#endif // slmaplibs_map_options_hpp_included_
