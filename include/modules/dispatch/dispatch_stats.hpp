#pragma once
#include <atomic>
#include <cstdint>
#include "cmdpipe/cmdpipe.hpp"
#include "modules/remote/execution.hpp"

namespace cmdpipe::modules::dispatch {

// Counters of one dispatcher. Shared with the executions it hands out,
// which may outlive the dispatcher itself.
struct DispatchStats {
    std::atomic<uint64_t> received{0};   // taken off the channel
    std::atomic<uint64_t> coalesced{0};  // superseded before execution
    std::atomic<uint64_t> submitted{0};  // handed to an execution
    std::atomic<uint64_t> completed{0};
    std::atomic<uint64_t> aborted{0};

    void record(remote::ExecOutcome outcome) noexcept {
        if (outcome == remote::ExecOutcome::Completed) {
            completed.fetch_add(1, std::memory_order_relaxed);
        } else {
            aborted.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // Executions that have finished either way.
    [[nodiscard]] uint64_t finished() const noexcept {
        return completed.load(std::memory_order_relaxed) +
               aborted.load(std::memory_order_relaxed);
    }
};

} // namespace cmdpipe::modules::dispatch
