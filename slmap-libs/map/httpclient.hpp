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
 * \file map/httpclient.hpp
 *
 * Minimal HTTP GET transport.
 */

#ifndef slmaplibs_map_httpclient_hpp_included_
#define slmaplibs_map_httpclient_hpp_included_

#include <ctime>
#include <map>
#include <memory>
#include <string>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

namespace slmaplibs { namespace map {

struct HttpRequest {
    std::string url;

    /** Conditional request validators.
     */
    boost::optional<std::string> ifNoneMatch;
    boost::optional<std::time_t> ifModifiedSince;

    /** Timeout in ms, negative means no timeout.
     */
    long timeout;

    HttpRequest(const std::string &url = "", long timeout = -1)
        : url(url), timeout(timeout) {}
};

struct HttpResponse {
    /** Header name (lower-case) -> value.
     */
    typedef std::map<std::string, std::string> Headers;

    long status;
    std::string body;
    Headers headers;

    HttpResponse(long status = 0) : status(status) {}

    /** Returns header value or null if not present. Name must be lower-case.
     */
    const std::string* header(const std::string &name) const {
        auto fheaders(headers.find(name));
        if (fheaders == headers.end()) { return nullptr; }
        return &fheaders->second;
    }
};

/** HTTP client interface. Must be usable from multiple threads at once.
 */
class HttpClient : boost::noncopyable {
public:
    typedef std::shared_ptr<HttpClient> pointer;

    virtual ~HttpClient() {}

    /** Performs GET request. Any received status is returned in the
     *  response; transport failures throw storage::TransientError.
     */
    HttpResponse get(const HttpRequest &request) {
        return get_impl(request);
    }

private:
    virtual HttpResponse get_impl(const HttpRequest &request) = 0;
};

/** libcurl based client; one easy handle per request.
 */
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient(const std::string &userAgent = "slmap-libs");

    static pointer create(const std::string &userAgent = "slmap-libs");

private:
    virtual HttpResponse get_impl(const HttpRequest &request);

    const std::string userAgent_;
};

} } // namespace slmaplibs::map

#endif // slmaplibs_map_httpclient_hpp_included_
