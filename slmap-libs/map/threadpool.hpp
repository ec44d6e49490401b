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
 * \file map/threadpool.hpp
 *
 * Fixed size worker pool.
 */

#ifndef slmaplibs_map_threadpool_hpp_included_
#define slmaplibs_map_threadpool_hpp_included_

#include <queue>
#include <mutex>
#include <thread>
#include <vector>
#include <future>
#include <functional>
#include <condition_variable>

#include <boost/noncopyable.hpp>

namespace slmaplibs { namespace map {

/** Runs posted tasks on a fixed set of threads. Destructor finishes all
 *  queued tasks before joining.
 */
class ThreadPool : boost::noncopyable {
public:
    typedef std::function<void()> Task;

    ThreadPool(std::size_t size);
    ~ThreadPool();

    /** Queues task. Returned future transports task's exception, if any.
     */
    std::future<void> post(const Task &task);

    std::size_t size() const { return workers_.size(); }

private:
    void worker(std::size_t id);

    std::vector<std::thread> workers_;
    std::queue<std::packaged_task<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cond_;
    bool stop_;
};

} } // namespace slmaplibs::map

#endif // slmaplibs_map_threadpool_hpp_included_
