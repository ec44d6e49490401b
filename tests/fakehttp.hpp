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
 * \file fakehttp.hpp
 *
 * In-process HTTP client serving canned responses, plus test helpers.
 */

#ifndef slmaplibs_tests_fakehttp_hpp_included_
#define slmaplibs_tests_fakehttp_hpp_included_

#include <map>
#include <mutex>
#include <atomic>
#include <thread>
#include <chrono>
#include <vector>
#include <string>
#include <functional>

#include <boost/filesystem.hpp>

#include <opencv2/core/core.hpp>
#include <opencv2/imgcodecs/imgcodecs.hpp>

#include "slmap-libs/map/httpclient.hpp"
#include "slmap-libs/map/types.hpp"

namespace slmaplibs { namespace test {

class FakeHttpClient : public map::HttpClient {
public:
    typedef std::function<map::HttpResponse(const map::HttpRequest&)>
        Handler;

    typedef std::shared_ptr<FakeHttpClient> pointer;

    FakeHttpClient() : total_(0) {}

    /** Serves given URL by handler.
     */
    void handle(const std::string &url, const Handler &handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[url] = handler;
    }

    /** Serves given URL by canned response.
     */
    void respond(const std::string &url, const map::HttpResponse &response
                 , long delayMs = 0)
    {
        handle(url, [response, delayMs](const map::HttpRequest&)
        {
            if (delayMs) {
                std::this_thread::sleep_for
                    (std::chrono::milliseconds(delayMs));
            }
            return response;
        });
    }

    std::size_t requests(const std::string &url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count(0);
        for (const auto &request : log_) {
            if (request.url == url) { ++count; }
        }
        return count;
    }

    std::size_t requests() const { return total_; }

    std::vector<map::HttpRequest> log() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_;
    }

private:
    virtual map::HttpResponse get_impl(const map::HttpRequest &request) {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++total_;
            log_.push_back(request);
            auto fhandlers(handlers_.find(request.url));
            if (fhandlers != handlers_.end()) {
                handler = fhandlers->second;
            }
        }

        if (!handler) { return map::HttpResponse(404); }
        return handler(request);
    }

    mutable std::mutex mutex_;
    std::map<std::string, Handler> handlers_;
    std::vector<map::HttpRequest> log_;
    std::atomic<std::size_t> total_;
};

inline map::HttpResponse response(long status, const std::string &body = ""
                                  , const map::HttpResponse::Headers &headers
                                  = map::HttpResponse::Headers())
{
    map::HttpResponse r(status);
    r.body = body;
    r.headers = headers;
    return r;
}

/** Lossless (PNG) encoded solid tile.
 */
inline std::string tileImage(const map::Color &color
                             , int size = map::TilePixels)
{
    cv::Mat image(size, size, CV_8UC3
                  , cv::Scalar(color.b, color.g, color.r));
    std::vector<unsigned char> buf;
    cv::imencode(".png", image, buf);
    return std::string(buf.begin(), buf.end());
}

/** Temporary directory removed on destruction.
 */
class TemporaryDirectory {
public:
    TemporaryDirectory()
        : path_(boost::filesystem::temp_directory_path()
                / boost::filesystem::unique_path("slmap-test-%%%%-%%%%-%%%%"))
    {
        boost::filesystem::create_directories(path_);
    }

    ~TemporaryDirectory() {
        boost::system::error_code ec;
        boost::filesystem::remove_all(path_, ec);
    }

    const boost::filesystem::path& path() const { return path_; }

private:
    boost::filesystem::path path_;
};

} } // namespace slmaplibs::test

#endif // slmaplibs_tests_fakehttp_hpp_included_
