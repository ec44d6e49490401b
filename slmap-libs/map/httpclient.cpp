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
#include <mutex>

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <curl/curl.h>

#include "dbglog/dbglog.hpp"

#include "../storage/error.hpp"

#include "cachecontrol.hpp"
#include "httpclient.hpp"

namespace ba = boost::algorithm;

namespace slmaplibs { namespace map {

namespace {

std::once_flag curlInitFlag;

void initCurl()
{
    std::call_once(curlInitFlag, []()
    {
        const auto res(curl_global_init(CURL_GLOBAL_DEFAULT));
        if (res != CURLE_OK) {
            LOGTHROW(err3, storage::Error)
                << "Unable to initialize libcurl: <"
                << curl_easy_strerror(res) << ">.";
        }
    });
}

struct EasyDeleter {
    void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

typedef std::unique_ptr<CURL, EasyDeleter> Easy;
typedef std::unique_ptr<curl_slist, SlistDeleter> Slist;

std::size_t writeCallback(char *ptr, std::size_t size, std::size_t nmemb
                          , void *userdata)
{
    auto &response(*static_cast<HttpResponse*>(userdata));
    response.body.append(ptr, size * nmemb);
    return size * nmemb;
}

std::size_t headerCallback(char *ptr, std::size_t size, std::size_t nmemb
                           , void *userdata)
{
    auto &response(*static_cast<HttpResponse*>(userdata));
    const std::string line(ptr, size * nmemb);

    if (ba::starts_with(line, "HTTP/")) {
        // new status line (after redirect or 100-continue)
        response.headers.clear();
        return size * nmemb;
    }

    const auto colon(line.find(':'));
    if (colon == std::string::npos) { return size * nmemb; }

    auto name(ba::to_lower_copy(ba::trim_copy(line.substr(0, colon))));
    auto value(ba::trim_copy(line.substr(colon + 1)));
    response.headers[name] = value;

    return size * nmemb;
}

template <typename T>
void setopt(CURL *curl, CURLoption option, T value)
{
    const auto res(curl_easy_setopt(curl, option, value));
    if (res != CURLE_OK) {
        LOGTHROW(err2, storage::Error)
            << "Unable to set curl option " << option << ": <"
            << curl_easy_strerror(res) << ">.";
    }
}

} // namespace

CurlHttpClient::CurlHttpClient(const std::string &userAgent)
    : userAgent_(userAgent)
{
    initCurl();
}

HttpClient::pointer CurlHttpClient::create(const std::string &userAgent)
{
    return std::make_shared<CurlHttpClient>(userAgent);
}

HttpResponse CurlHttpClient::get_impl(const HttpRequest &request)
{
    Easy curl(curl_easy_init());
    if (!curl) {
        LOGTHROW(err2, storage::Error)
            << "Unable to create curl handle.";
    }

    HttpResponse response;

    Slist headers;
    auto addHeader([&](const std::string &header)
    {
        auto list(curl_slist_append(headers.get(), header.c_str()));
        if (!list) {
            LOGTHROW(err2, storage::Error)
                << "Unable to build request headers.";
        }
        headers.release();
        headers.reset(list);
    });

    if (request.ifNoneMatch) {
        addHeader("If-None-Match: " + *request.ifNoneMatch);
    }
    if (request.ifModifiedSince) {
        addHeader("If-Modified-Since: "
                  + formatHttpDate(*request.ifModifiedSince));
    }

    auto *c(curl.get());
    setopt(c, CURLOPT_URL, request.url.c_str());
    setopt(c, CURLOPT_USERAGENT, userAgent_.c_str());
    setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    setopt(c, CURLOPT_MAXREDIRS, 5L);
    setopt(c, CURLOPT_NOSIGNAL, 1L);
    setopt(c, CURLOPT_WRITEFUNCTION, &writeCallback);
    setopt(c, CURLOPT_WRITEDATA, static_cast<void*>(&response));
    setopt(c, CURLOPT_HEADERFUNCTION, &headerCallback);
    setopt(c, CURLOPT_HEADERDATA, static_cast<void*>(&response));
    if (request.timeout >= 0) {
        setopt(c, CURLOPT_TIMEOUT_MS, request.timeout);
    }
    if (headers) {
        setopt(c, CURLOPT_HTTPHEADER, headers.get());
    }

    LOG(info1) << "Fetching <" << request.url << ">"
               << (request.ifNoneMatch || request.ifModifiedSince
                   ? " (conditional)" : "") << ".";

    const auto res(curl_easy_perform(c));
    if (res != CURLE_OK) {
        LOGTHROW(err1, storage::TransientError)
            << "Failed to fetch <" << request.url << ">: <"
            << curl_easy_strerror(res) << ">.";
    }

    long status(0);
    const auto ires(curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status));
    if (ires != CURLE_OK) {
        LOGTHROW(err1, storage::TransientError)
            << "Failed to get status of <" << request.url << ">: <"
            << curl_easy_strerror(ires) << ">.";
    }
    response.status = status;

    LOG(debug) << "Fetched <" << request.url << ">: status "
               << response.status << ", " << response.body.size()
               << " bytes.";

    return response;
}

} } // namespace slmaplibs::map
