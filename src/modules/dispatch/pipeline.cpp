#include "modules/dispatch/pipeline.hpp"

#include <stdexcept>
#include <utility>

#include <glog/logging.h>

namespace cmdpipe::modules::dispatch {

void PipelineConfig::validate() const
{
    if (worker_threads == 0) {
        throw std::invalid_argument("PipelineConfig: worker_threads must be positive");
    }
    if (min_width == 0 || min_height == 0) {
        throw std::invalid_argument("PipelineConfig: resize minimums must be positive");
    }
}

struct Pipeline::Channels {
    CommandSender   droppable_tx;
    CommandReceiver droppable_rx;
    CommandSender   guaranteed_tx;
    CommandReceiver guaranteed_rx;

    static Channels make() {
        auto [dtx, drx] = exec::primitives::make_channel<model::Command>();
        auto [gtx, grx] = exec::primitives::make_channel<model::Command>();
        return Channels{std::move(dtx), std::move(drx), std::move(gtx), std::move(grx)};
    }
};

namespace {

remote::ExecutionContext configured(remote::ExecutionContext context, const PipelineConfig& config)
{
    config.validate();
    if (!context.session) {
        throw std::invalid_argument("Pipeline: remote session is required");
    }
    context.min_width  = config.min_width;
    context.min_height = config.min_height;
    return context;
}

} // namespace

Pipeline::Pipeline(CommandReceiver inbound,
                   remote::ExecutionContext context,
                   const PipelineConfig& config,
                   exec::CancellationToken shutdown)
    : Pipeline(std::move(inbound), configured(std::move(context), config), config,
               std::move(shutdown), Channels::make())
{
}

Pipeline::Pipeline(CommandReceiver inbound,
                   remote::ExecutionContext context,
                   const PipelineConfig& config,
                   exec::CancellationToken shutdown,
                   Channels channels)
    : shutdown_(std::move(shutdown)),
      pool_(config.worker_threads),
      router_(std::move(inbound), std::move(channels.droppable_tx),
              std::move(channels.guaranteed_tx), shutdown_),
      coalescing_(std::move(channels.droppable_rx), context, pool_),
      sequential_(std::move(channels.guaranteed_rx), std::move(context), shutdown_)
{
}

Pipeline::~Pipeline()
{
    join();
}

void Pipeline::start()
{
    LOG(INFO) << "command pipeline starting on " << CMDPIPE_OS_NAME << " with "
              << pool_.size() << " workers";
    sequential_task_.start();
    coalescing_task_.start();
    router_task_.start();
}

void Pipeline::join() noexcept
{
    router_task_.join();
    coalescing_task_.join();
    sequential_task_.join();
}

void Pipeline::drain_workers() noexcept
{
    pool_.shutdown();
}

bool Pipeline::finished() const noexcept
{
    return router_task_.finished() && coalescing_task_.finished() &&
           sequential_task_.finished();
}

uint32_t Pipeline::heartbeat(std::size_t stage) const noexcept
{
    switch (stage) {
    case 0:  return hb_router_.load(std::memory_order_acquire);
    case 1:  return hb_coalescing_.load(std::memory_order_acquire);
    case 2:  return hb_sequential_.load(std::memory_order_acquire);
    default: return 0;
    }
}

} // namespace cmdpipe::modules::dispatch
