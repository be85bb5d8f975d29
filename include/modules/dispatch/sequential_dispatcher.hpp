#pragma once
#include <memory>
#include "cmdpipe/cmdpipe.hpp"
#include "exec/cancellation.hpp"
#include "model/command.hpp"
#include "model/tags.hpp"
#include "modules/dispatch/dispatch_stats.hpp"
#include "modules/dispatch/router.hpp"
#include "modules/remote/execution.hpp"

namespace cmdpipe::modules::dispatch {

/*
 * SequentialDispatcher - owner of the guaranteed channel.
 *
 * Executes commands one at a time, in arrival order, each to completion
 * before the next is taken. Never reorders, coalesces or drops.
 *
 * Shutdown: channel closure sets the flag and stops the loop. Once the
 * flag is set no new blocking wait is started; commands already buffered
 * were accepted by the router and are still executed.
 */
class SequentialDispatcher final {
public:
    SequentialDispatcher(CommandReceiver guaranteed,
                         remote::ExecutionContext context,
                         exec::CancellationToken shutdown);

    SequentialDispatcher(const SequentialDispatcher&) = delete;
    SequentialDispatcher& operator=(const SequentialDispatcher&) = delete;

    [[nodiscard]] model::StepResult step() noexcept;

    [[nodiscard]] const DispatchStats& stats() const noexcept { return *stats_; }

private:
    void run(model::Command command) noexcept;

    CommandReceiver                guaranteed_;
    remote::ExecutionContext       context_;
    exec::CancellationToken        shutdown_;
    std::shared_ptr<DispatchStats> stats_;
};

} // namespace cmdpipe::modules::dispatch
