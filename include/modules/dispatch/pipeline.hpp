#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include "cmdpipe/cmdpipe.hpp"
#include "exec/cancellation.hpp"
#include "exec/tasks/taskwrapper.hpp"
#include "exec/worker_pool.hpp"
#include "modules/dispatch/coalescing_dispatcher.hpp"
#include "modules/dispatch/router.hpp"
#include "modules/dispatch/sequential_dispatcher.hpp"
#include "modules/remote/execution.hpp"

namespace cmdpipe::modules::dispatch {

struct PipelineConfig {
    std::size_t worker_threads{CMDPIPE_DEFAULT_WORKERS};
    uint32_t    min_width{CMDPIPE_MIN_RESIZE_WIDTH};
    uint32_t    min_height{CMDPIPE_MIN_RESIZE_HEIGHT};

    // Throws std::invalid_argument on a zero field.
    void validate() const;
};

/*
 * Pipeline - wires the router and both dispatchers over two internal
 * channels and runs each stage on its own thread.
 *
 *   inbound --> Router --+--> droppable  --> CoalescingDispatcher --> pool
 *                        +--> guaranteed --> SequentialDispatcher
 *
 * Closing the inbound channel (dropping its last sender) shuts the
 * pipeline down. join() waits for the three stage loops only; droppable
 * executions still queued in the pool finish on their own, and
 * drain_workers() waits for them.
 *
 * The destructor joins the stages: close the inbound channel first.
 */
class Pipeline final {
public:
    Pipeline(CommandReceiver inbound,
             remote::ExecutionContext context,
             const PipelineConfig& config = {},
             exec::CancellationToken shutdown = {});
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) = delete;
    Pipeline& operator=(Pipeline&&) = delete;

    void start();
    void join() noexcept;
    void drain_workers() noexcept;

    [[nodiscard]] bool finished() const noexcept;
    [[nodiscard]] const exec::CancellationToken& shutdown_token() const noexcept { return shutdown_; }

    [[nodiscard]] const Router& router() const noexcept { return router_; }
    [[nodiscard]] const DispatchStats& droppable_stats() const noexcept { return coalescing_.stats(); }
    [[nodiscard]] const DispatchStats& guaranteed_stats() const noexcept { return sequential_.stats(); }

    // Loop iterations per stage, in stage order router/coalescing/sequential.
    [[nodiscard]] uint32_t heartbeat(std::size_t stage) const noexcept;

private:
    struct Channels;

    Pipeline(CommandReceiver inbound,
             remote::ExecutionContext context,
             const PipelineConfig& config,
             exec::CancellationToken shutdown,
             Channels channels);

    exec::CancellationToken shutdown_;
    exec::WorkerPool        pool_;

    Router               router_;
    CoalescingDispatcher coalescing_;
    SequentialDispatcher sequential_;

    std::atomic<uint32_t> hb_router_{0};
    std::atomic<uint32_t> hb_coalescing_{0};
    std::atomic<uint32_t> hb_sequential_{0};

    exec::tasks::TaskWrapper<Router>               router_task_{router_, hb_router_};
    exec::tasks::TaskWrapper<CoalescingDispatcher> coalescing_task_{coalescing_, hb_coalescing_};
    exec::tasks::TaskWrapper<SequentialDispatcher> sequential_task_{sequential_, hb_sequential_};
};

} // namespace cmdpipe::modules::dispatch
