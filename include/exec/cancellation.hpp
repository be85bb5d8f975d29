#pragma once

#include "cmdpipe/cmdpipe.hpp"
#include <atomic>
#include <memory>

namespace cmdpipe::exec {

/*
 * CancellationToken - shared one-way shutdown flag.
 *
 * Copies share the same flag. The flag starts false, becomes true on the
 * first cancel() and never goes back.
 */
class CancellationToken final {
public:
    CancellationToken()
        : state_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_->load(std::memory_order_acquire);
    }

    // Returns true only for the call that performed the transition.
    bool cancel() noexcept {
        return !state_->exchange(true, std::memory_order_acq_rel);
    }

    // Two tokens observe the same flag.
    [[nodiscard]] bool shares_state_with(const CancellationToken& other) const noexcept {
        return state_ == other.state_;
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace cmdpipe::exec
