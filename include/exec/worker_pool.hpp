#pragma once

#include "cmdpipe/cmdpipe.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace cmdpipe::exec {

/*
 * WorkerPool - bounded set of threads running short fire-and-forget tasks.
 *
 *  - submit() never blocks and never waits for the task.
 *  - Tasks run in an unspecified order on any worker.
 *  - shutdown() stops intake, runs what is already queued, joins workers.
 *    Idempotent; the destructor calls it. Must not be called from a task.
 */
class WorkerPool final {
public:
    using Task = std::function<void()>;

    // Throws std::invalid_argument when threads == 0.
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&)                 = delete;
    WorkerPool& operator=(WorkerPool&&)      = delete;

    // false once shutdown() has begun; the task is dropped.
    [[nodiscard]] bool submit(Task task);

    void shutdown() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

    // Approximate; telemetry only.
    [[nodiscard]] std::size_t pending() const;

private:
    void worker_loop() noexcept;

    mutable std::mutex       mutex_;
    std::condition_variable  wake_;
    std::deque<Task>         tasks_;
    bool                     stopping_{false};
    std::vector<std::thread> workers_;
};

} // namespace cmdpipe::exec
