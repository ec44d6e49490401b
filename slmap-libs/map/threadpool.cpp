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

#include <boost/format.hpp>

#include "dbglog/dbglog.hpp"

#include "threadpool.hpp"

namespace slmaplibs { namespace map {

ThreadPool::ThreadPool(std::size_t size)
    : stop_(false)
{
    size = std::max(size, std::size_t(1));
    for (std::size_t id(1); id <= size; ++id) {
        workers_.emplace_back(&ThreadPool::worker, this, id);
    }
    LOG(info1) << "Started " << size << " worker threads.";
}

ThreadPool::~ThreadPool()
{
    {
        std::unique_lock<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cond_.notify_all();

    for (auto &worker : workers_) { worker.join(); }
}

std::future<void> ThreadPool::post(const Task &task)
{
    std::packaged_task<void()> pt(task);
    auto future(pt.get_future());
    {
        std::unique_lock<std::mutex> lock(mutex_);
        tasks_.push(std::move(pt));
    }
    cond_.notify_one();
    return future;
}

void ThreadPool::worker(std::size_t id)
{
    dbglog::thread_id(str(boost::format("pool:%u") % id));

    for (;;) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });
            if (tasks_.empty()) { return; }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // exceptions end up in the task's future
        task();
    }
}

} } // namespace slmaplibs::map
