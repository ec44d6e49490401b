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
#include <chrono>
#include <thread>
#include <vector>
#include <atomic>
#include <mutex>

#include <catch2/catch.hpp>

#include "slmap-libs/storage/ratelimiter.hpp"

namespace storage = slmaplibs::storage;

namespace {

typedef std::chrono::steady_clock Clock;

long elapsedMs(const Clock::time_point &start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>
        (Clock::now() - start).count();
}

} // namespace

TEST_CASE("burst passes without waiting", "[ratelimiter]")
{
    storage::RateLimiter limiter(1.0, 3);

    const auto start(Clock::now());
    limiter.acquire();
    limiter.acquire();
    limiter.acquire();
    CHECK(elapsedMs(start) < 500);
}

TEST_CASE("requests are spaced by rate", "[ratelimiter]")
{
    storage::RateLimiter limiter(20.0);

    const auto start(Clock::now());
    for (int i(0); i < 5; ++i) { limiter.acquire(); }

    // first token is there, four more take 50 ms each
    CHECK(elapsedMs(start) >= 180);
}

TEST_CASE("concurrent callers all get through", "[ratelimiter]")
{
    storage::RateLimiter limiter(100.0);
    std::atomic<int> passed(0);

    const auto start(Clock::now());
    std::vector<std::thread> threads;
    for (int i(0); i < 8; ++i) {
        threads.emplace_back([&]()
        {
            for (int j(0); j < 3; ++j) { limiter.acquire(); ++passed; }
        });
    }
    for (auto &t : threads) { t.join(); }

    CHECK(passed == 24);
    CHECK(elapsedMs(start) >= 200);
}

TEST_CASE("waiting callers are served in arrival order", "[ratelimiter]")
{
    storage::RateLimiter limiter(10.0);

    // drain the bucket so everybody below has to wait
    limiter.acquire();

    std::mutex mutex;
    std::vector<int> served;

    std::vector<std::thread> threads;
    for (int i(0); i < 5; ++i) {
        threads.emplace_back([&, i]()
        {
            limiter.acquire();
            std::lock_guard<std::mutex> lock(mutex);
            served.push_back(i);
        });
        // next caller arrives well before the next token
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    for (auto &t : threads) { t.join(); }

    CHECK(served == std::vector<int>({ 0, 1, 2, 3, 4 }));
}

TEST_CASE("zero rate disables throttling", "[ratelimiter]")
{
    storage::RateLimiter limiter(0.0);

    const auto start(Clock::now());
    for (int i(0); i < 1000; ++i) { limiter.acquire(); }
    CHECK(elapsedMs(start) < 500);
}
