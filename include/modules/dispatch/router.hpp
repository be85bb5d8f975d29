#pragma once
#include <atomic>
#include <cstdint>
#include "cmdpipe/cmdpipe.hpp"
#include "exec/cancellation.hpp"
#include "exec/primitives/channel.hpp"
#include "model/command.hpp"
#include "model/tags.hpp"

namespace cmdpipe::modules::dispatch {

using CommandSender   = exec::primitives::ChannelSender<model::Command>;
using CommandReceiver = exec::primitives::ChannelReceiver<model::Command>;

/*
 * Router - sole consumer of the inbound stream, sole producer of the
 * droppable and guaranteed channels.
 *
 * One step: wait for a command, classify it, send it to exactly one
 * channel. Inbound closure sets the shutdown flag and stops the loop;
 * done() then releases both senders, which closes the channels.
 */
class Router final {
public:
    Router(CommandReceiver inbound,
           CommandSender droppable,
           CommandSender guaranteed,
           exec::CancellationToken shutdown) noexcept;

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    [[nodiscard]] model::StepResult step() noexcept;
    void done() noexcept;

    [[nodiscard]] uint64_t routed_droppable() const noexcept {
        return routed_droppable_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t routed_guaranteed() const noexcept {
        return routed_guaranteed_.load(std::memory_order_relaxed);
    }

private:
    CommandReceiver         inbound_;
    CommandSender           droppable_;
    CommandSender           guaranteed_;
    exec::CancellationToken shutdown_;

    std::atomic<uint64_t> routed_droppable_{0};
    std::atomic<uint64_t> routed_guaranteed_{0};
};

} // namespace cmdpipe::modules::dispatch
