#pragma once

#include "cmdpipe/cmdpipe.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace cmdpipe::exec::primitives {

/*
 * Channel - unbounded multi-producer / single-consumer FIFO queue.
 *
 * CONTRACT:
 *  - any number of senders (copies of ChannelSender), exactly 1 receiver
 *  - the receiver is NOT shared between threads
 *  - T is nothrow move constructible
 *
 * SEMANTICS:
 *  - Queue primitive: every sent value is delivered once, in FIFO order.
 *  - send() never blocks; capacity is unbounded.
 *  - Destroying (or close()-ing) the last sender closes the channel:
 *    recv() first drains buffered values, then returns std::nullopt.
 *  - Destroying the receiver makes every further send() return false;
 *    values still buffered are destroyed with the core.
 *
 * Unlike SPSC primitives with trivially copyable payloads, values here own
 * heap memory (strings), so the queue is a mutex-guarded deque.
 */

// ============================================================================
// Forward declarations
// ============================================================================

template <typename T> class ChannelSender;
template <typename T> class ChannelReceiver;

// ============================================================================
// Core (shared state carrier)
// ============================================================================

template <typename T>
struct ChannelCore final {
    static_assert(std::is_nothrow_move_constructible_v<T>,
                  "Channel requires nothrow move constructible T");

    friend class ChannelSender<T>;
    friend class ChannelReceiver<T>;

    std::mutex              mutex;
    std::condition_variable ready;   // signalled on send and on last-sender close
    std::deque<T>           queue;
    std::size_t             senders{1};
    bool                    receiver_alive{true};
};

// ============================================================================
// Producer view
// ============================================================================

template <typename T>
class ChannelSender final {
public:
    explicit ChannelSender(std::shared_ptr<ChannelCore<T>> core) noexcept
        : core_(std::move(core)) {}

    ~ChannelSender() { close(); }

    // Copy = one more producer.
    ChannelSender(const ChannelSender& other) : core_(other.core_) {
        if (core_) {
            std::lock_guard lock(core_->mutex);
            ++core_->senders;
        }
    }
    ChannelSender& operator=(const ChannelSender&) = delete;

    // Move = transfer of producer role (not duplication).
    ChannelSender(ChannelSender&& other) noexcept : core_(std::move(other.core_)) {}
    ChannelSender& operator=(ChannelSender&& other) noexcept {
        if (this != &other) {
            close();
            core_ = std::move(other.core_);
        }
        return *this;
    }

    // Returns false when the receiver is gone or this sender was closed.
    [[nodiscard]] bool send(T value) {
        if (!core_) {
            return false;
        }
        {
            std::lock_guard lock(core_->mutex);
            if (!core_->receiver_alive) {
                return false;
            }
            core_->queue.push_back(std::move(value));
        }
        core_->ready.notify_one();
        return true;
    }

    // Drops this producer. The channel closes when the last one is dropped.
    void close() noexcept {
        if (!core_) {
            return;
        }
        bool last = false;
        {
            std::lock_guard lock(core_->mutex);
            last = (--core_->senders == 0);
        }
        if (last) {
            core_->ready.notify_all();
        }
        core_.reset();
    }

    [[nodiscard]] bool is_open() const noexcept { return core_ != nullptr; }

private:
    std::shared_ptr<ChannelCore<T>> core_;
};

// ============================================================================
// Consumer view
// ============================================================================

template <typename T>
class ChannelReceiver final {
public:
    explicit ChannelReceiver(std::shared_ptr<ChannelCore<T>> core) noexcept
        : core_(std::move(core)) {}

    ~ChannelReceiver() { detach(); }

    ChannelReceiver(const ChannelReceiver&)            = delete;
    ChannelReceiver& operator=(const ChannelReceiver&) = delete;

    // Move = transfer of consumer role (not duplication).
    ChannelReceiver(ChannelReceiver&& other) noexcept : core_(std::move(other.core_)) {}
    ChannelReceiver& operator=(ChannelReceiver&& other) noexcept {
        if (this != &other) {
            detach();
            core_ = std::move(other.core_);
        }
        return *this;
    }

    // Blocks until a value is available or the channel is closed and drained.
    [[nodiscard]] std::optional<T> recv() {
        if (!core_) {
            return std::nullopt;
        }
        std::unique_lock lock(core_->mutex);
        core_->ready.wait(lock, [this] {
            return !core_->queue.empty() || core_->senders == 0;
        });
        return pop_locked();
    }

    // Never blocks. std::nullopt when nothing is buffered right now.
    [[nodiscard]] std::optional<T> try_recv() {
        if (!core_) {
            return std::nullopt;
        }
        std::lock_guard lock(core_->mutex);
        return pop_locked();
    }

    // True once every sender is gone and the buffer is drained.
    [[nodiscard]] bool is_closed() const {
        if (!core_) {
            return true;
        }
        std::lock_guard lock(core_->mutex);
        return core_->senders == 0 && core_->queue.empty();
    }

    // Approximate; telemetry only.
    [[nodiscard]] std::size_t buffered() const {
        if (!core_) {
            return 0;
        }
        std::lock_guard lock(core_->mutex);
        return core_->queue.size();
    }

private:
    std::optional<T> pop_locked() {
        if (core_->queue.empty()) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(core_->queue.front()));
        core_->queue.pop_front();
        return value;
    }

    void detach() noexcept {
        if (!core_) {
            return;
        }
        {
            std::lock_guard lock(core_->mutex);
            core_->receiver_alive = false;
        }
        core_.reset();
    }

    std::shared_ptr<ChannelCore<T>> core_;
};

// ============================================================================
// Factory
// ============================================================================

template <typename T>
[[nodiscard]] std::pair<ChannelSender<T>, ChannelReceiver<T>> make_channel() {
    auto core = std::make_shared<ChannelCore<T>>();
    return {ChannelSender<T>(core), ChannelReceiver<T>(std::move(core))};
}

} // namespace cmdpipe::exec::primitives
