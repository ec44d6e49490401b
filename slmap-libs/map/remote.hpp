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
 * \file map/remote.hpp
 *
 * Throttled remote request with retries.
 */

#ifndef slmaplibs_map_remote_hpp_included_
#define slmaplibs_map_remote_hpp_included_

#include "../storage/ratelimiter.hpp"

#include "httpclient.hpp"
#include "options.hpp"

namespace slmaplibs { namespace map { namespace remote {

/** Performs GET request. Every attempt waits for a rate limiter token.
 *
 *  Transport failures, 5xx and 429 statuses are retried (up to
 *  options.ioRetries() times, first retry after options.ioRetryDelay(),
 *  delay doubled after each failure); when all tries fail the last
 *  storage::TransientError is thrown. Any other response is returned as is.
 */
HttpResponse perform(HttpClient &client, storage::RateLimiter &limiter
                     , const HttpRequest &request, const Options &options);

/** True for statuses worth retrying.
 */
bool transientStatus(long status);

} } } // namespace slmaplibs::map::remote

#endif // slmaplibs_map_remote_hpp_included_
