#pragma once
#include <atomic>
#include <cstdint>
#include <thread>
#include "cmdpipe/cmdpipe.hpp"
#include "model/tags.hpp"

namespace cmdpipe::exec::tasks {

// Drives one long-lived stage loop: init(), step() until Stop, done().
// hb counts completed steps (heartbeat for supervisors and tests).
template <cmdpipe::model::Steppable Payload>
class TaskWrapper {
public:
    explicit TaskWrapper(Payload& payload, std::atomic<uint32_t>& hb) noexcept
        : payload_(payload), hb_(hb)
    {
    }

    ~TaskWrapper() { join(); }

    TaskWrapper(const TaskWrapper&) = delete;
    TaskWrapper& operator=(const TaskWrapper&) = delete;
    TaskWrapper(TaskWrapper&&) = delete;
    TaskWrapper& operator=(TaskWrapper&&) = delete;

    // Runs the loop on the calling thread.
    void run() noexcept {
        init();
        while (step() == cmdpipe::model::StepResult::Continue) {
        }
        done();
        finished_.store(true, std::memory_order_release);
    }

    // Runs the loop on a dedicated thread. At most once.
    void start() {
        if (!thread_.joinable()) {
            thread_ = std::thread([this] { run(); });
        }
    }

    void join() noexcept {
        if (thread_.joinable()) thread_.join();
    }

    cmdpipe::model::StepResult step() noexcept {
        const auto result = payload_.step();
        hb_.fetch_add(1, std::memory_order_release);
        return result;
    }

    [[nodiscard]] bool finished() const noexcept {
        return finished_.load(std::memory_order_acquire);
    }

    void init() noexcept {
        if constexpr (requires(Payload& p) { p.init(); }) payload_.init();
    }
    void done() noexcept {
        if constexpr (requires(Payload& p) { p.done(); }) payload_.done();
    }

private:
    Payload& payload_;
    std::atomic<uint32_t>& hb_;
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

} // namespace cmdpipe::exec::tasks
