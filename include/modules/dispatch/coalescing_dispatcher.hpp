#pragma once
#include <memory>
#include "cmdpipe/cmdpipe.hpp"
#include "exec/worker_pool.hpp"
#include "model/command.hpp"
#include "model/tags.hpp"
#include "modules/dispatch/dispatch_stats.hpp"
#include "modules/dispatch/router.hpp"
#include "modules/remote/execution.hpp"

namespace cmdpipe::modules::dispatch {

/*
 * CoalescingDispatcher - owner of the droppable channel.
 *
 * One step:
 *  1. block until a command is available
 *  2. drain what is already buffered without blocking, keep the last one;
 *     the others are discarded (normal operation, not an error)
 *  3. hand the survivor to the worker pool and return at once
 *
 * Ends on channel closure only; it does not look at the shutdown flag.
 * Submitted executions are not tracked: they may finish out of order
 * and may outlive the dispatcher.
 */
class CoalescingDispatcher final {
public:
    CoalescingDispatcher(CommandReceiver droppable,
                         remote::ExecutionContext context,
                         exec::WorkerPool& pool);

    CoalescingDispatcher(const CoalescingDispatcher&) = delete;
    CoalescingDispatcher& operator=(const CoalescingDispatcher&) = delete;

    [[nodiscard]] model::StepResult step() noexcept;

    [[nodiscard]] const DispatchStats& stats() const noexcept { return *stats_; }

private:
    void submit(model::Command command) noexcept;

    CommandReceiver                droppable_;
    remote::ExecutionContext       context_;
    exec::WorkerPool&              pool_;
    std::shared_ptr<DispatchStats> stats_;
};

} // namespace cmdpipe::modules::dispatch
