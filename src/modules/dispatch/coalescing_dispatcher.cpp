#include "modules/dispatch/coalescing_dispatcher.hpp"

#include <cstdint>
#include <utility>

#include <glog/logging.h>

namespace cmdpipe::modules::dispatch {

CoalescingDispatcher::CoalescingDispatcher(CommandReceiver droppable,
                                           remote::ExecutionContext context,
                                           exec::WorkerPool& pool)
    : droppable_(std::move(droppable)),
      context_(std::move(context)),
      pool_(pool),
      stats_(std::make_shared<DispatchStats>())
{
}

model::StepResult CoalescingDispatcher::step() noexcept
{
    auto latest = droppable_.recv();
    if (!latest) {
        VLOG(CMDPIPE_TRACE_VLOG_LEVEL) << "droppable channel closed";
        return model::StepResult::Stop;
    }

    uint64_t superseded = 0;
    while (auto newer = droppable_.try_recv()) {
        latest = std::move(newer);
        ++superseded;
    }

    stats_->received.fetch_add(superseded + 1, std::memory_order_relaxed);
    if (superseded > 0) {
        stats_->coalesced.fetch_add(superseded, std::memory_order_relaxed);
        VLOG(CMDPIPE_TRACE_VLOG_LEVEL) << "coalesced " << superseded
                                       << " droppable commands into "
                                       << model::describe(*latest);
    }

    submit(std::move(*latest));
    return model::StepResult::Continue;
}

void CoalescingDispatcher::submit(model::Command command) noexcept
{
    const auto name = model::command_name(command);
    const bool accepted = pool_.submit(
        [context = context_, stats = stats_, command = std::move(command)]() mutable {
            stats->record(remote::execute(std::move(command), context));
        });

    if (!accepted) {
        LOG(WARNING) << "worker pool stopped, " << name << " command not executed";
        return;
    }
    stats_->submitted.fetch_add(1, std::memory_order_relaxed);
}

} // namespace cmdpipe::modules::dispatch
