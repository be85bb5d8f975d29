#include "modules/dispatch/sequential_dispatcher.hpp"

#include <utility>

#include <glog/logging.h>

namespace cmdpipe::modules::dispatch {

SequentialDispatcher::SequentialDispatcher(CommandReceiver guaranteed,
                                           remote::ExecutionContext context,
                                           exec::CancellationToken shutdown)
    : guaranteed_(std::move(guaranteed)),
      context_(std::move(context)),
      shutdown_(std::move(shutdown)),
      stats_(std::make_shared<DispatchStats>())
{
}

model::StepResult SequentialDispatcher::step() noexcept
{
    if (shutdown_.is_cancelled()) {
        while (auto command = guaranteed_.try_recv()) {
            run(std::move(*command));
        }
        return model::StepResult::Stop;
    }

    auto command = guaranteed_.recv();
    if (!command) {
        VLOG(CMDPIPE_TRACE_VLOG_LEVEL) << "guaranteed channel closed";
        shutdown_.cancel();
        return model::StepResult::Stop;
    }

    run(std::move(*command));
    return model::StepResult::Continue;
}

void SequentialDispatcher::run(model::Command command) noexcept
{
    stats_->received.fetch_add(1, std::memory_order_relaxed);
    stats_->submitted.fetch_add(1, std::memory_order_relaxed);
    stats_->record(remote::execute(std::move(command), context_));
}

} // namespace cmdpipe::modules::dispatch
