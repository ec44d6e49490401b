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

#include "dbglog/dbglog.hpp"

#include "ratelimiter.hpp"

namespace slmaplibs { namespace storage {

RateLimiter::RateLimiter(double rate, unsigned int burst)
    : rate_(rate), burst_(std::max(burst, 1u))
    , tokens_(burst_), last_(Clock::now())
    , nextTicket_(0), serving_(0)
{
    if (rate_ > 0) {
        LOG(info1) << "Throttling requests to " << rate_
                   << "/s (burst " << burst_ << ").";
    } else {
        LOG(info1) << "Request throttling disabled.";
    }
}

void RateLimiter::refill(const Clock::time_point &now)
{
    const std::chrono::duration<double> elapsed(now - last_);
    tokens_ = std::min(double(burst_), tokens_ + elapsed.count() * rate_);
    last_ = now;
}

void RateLimiter::acquire()
{
    if (rate_ <= 0) { return; }

    std::unique_lock<std::mutex> lock(mutex_);
    const auto ticket(nextTicket_++);

    for (;;) {
        if (ticket != serving_) {
            // not our turn yet
            cond_.wait(lock);
            continue;
        }

        const auto now(Clock::now());
        refill(now);
        if (tokens_ >= 1.0) {
            tokens_ -= 1.0;
            ++serving_;
            lock.unlock();
            cond_.notify_all();
            return;
        }

        // sleep until next token drips in
        const std::chrono::duration<double> missing((1.0 - tokens_) / rate_);
        cond_.wait_until
            (lock, now + std::chrono::duration_cast<Clock::duration>
             (missing));
    }
}

} } // namespace slmaplibs::storage
