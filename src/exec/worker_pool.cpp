#include "exec/worker_pool.hpp"

#include <stdexcept>
#include <utility>

#include <glog/logging.h>

namespace cmdpipe::exec {

WorkerPool::WorkerPool(std::size_t threads)
{
    if (threads == 0) {
        throw std::invalid_argument("WorkerPool needs at least one thread");
    }
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    VLOG(CMDPIPE_TRACE_VLOG_LEVEL) << "worker pool started with " << threads << " threads";
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

bool WorkerPool::submit(Task task)
{
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    wake_.notify_one();
    return true;
}

void WorkerPool::shutdown() noexcept
{
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    wake_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t WorkerPool::pending() const
{
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

void WorkerPool::worker_loop() noexcept
{
    for (;;) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            wake_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}

} // namespace cmdpipe::exec
