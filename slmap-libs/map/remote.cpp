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
#include <thread>
#include <chrono>

#include "dbglog/dbglog.hpp"

#include "../storage/error.hpp"

#include "remote.hpp"

namespace slmaplibs { namespace map { namespace remote {

bool transientStatus(long status)
{
    return (status == 429) || ((status >= 500) && (status <= 599));
}

HttpResponse perform(HttpClient &client, storage::RateLimiter &limiter
                     , const HttpRequest &request, const Options &options)
{
    auto tryFetch([&]() -> HttpResponse
    {
        limiter.acquire();
        auto response(client.get(request));
        if (transientStatus(response.status)) {
            LOGTHROW(err1, storage::TransientError)
                << "Failed to fetch <" << request.url
                << ">: HTTP status " << response.status << ".";
        }
        return response;
    });

    unsigned long delay(options.ioRetryDelay());
    for (auto tries(options.ioRetries()); tries; (tries > 0) ? --tries : 0) {
        try {
            return tryFetch();
        } catch (const storage::TransientError&) {
            LOG(warn2) << "Failed to fetch <" << request.url
                       << ">; retrying in " << delay << " ms.";
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        delay *= 2;
    }
    return tryFetch();
}

} } } // namespace slmaplibs::map::remote
