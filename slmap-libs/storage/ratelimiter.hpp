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
 * \file storage/ratelimiter.hpp
 *
 * Token bucket shared by all outbound requests.
 */

#ifndef slmaplibs_storage_ratelimiter_hpp_included_
#define slmaplibs_storage_ratelimiter_hpp_included_

#include <mutex>
#include <chrono>
#include <cstdint>
#include <condition_variable>

#include <boost/noncopyable.hpp>

namespace slmaplibs { namespace storage {

/** Token bucket with fixed refill rate and burst capacity.
 *
 *  Waiting callers are served in arrival order (ticket based) so nobody
 *  starves while others keep acquiring.
 */
class RateLimiter : boost::noncopyable {
public:
    typedef std::chrono::steady_clock Clock;

    /** \param rate tokens per second; rate <= 0 disables throttling
     *  \param burst bucket capacity (at least 1)
     */
    RateLimiter(double rate, unsigned int burst = 1);

    /** Blocks until a token is available and takes it.
     */
    void acquire();

    double rate() const { return rate_; }
    unsigned int burst() const { return burst_; }

private:
    void refill(const Clock::time_point &now);

    const double rate_;
    const unsigned int burst_;

    double tokens_;
    Clock::time_point last_;

    std::uint64_t nextTicket_;
    std::uint64_t serving_;

    std::mutex mutex_;
    std::condition_variable cond_;
};

} } // namespace slmaplibs::storage

#endif // slmaplibs_storage_ratelimiter_hpp_included_
