#include "modules/dispatch/router.hpp"

#include <utility>

#include <glog/logging.h>

namespace cmdpipe::modules::dispatch {

Router::Router(CommandReceiver inbound,
               CommandSender droppable,
               CommandSender guaranteed,
               exec::CancellationToken shutdown) noexcept
    : inbound_(std::move(inbound)),
      droppable_(std::move(droppable)),
      guaranteed_(std::move(guaranteed)),
      shutdown_(std::move(shutdown))
{
}

model::StepResult Router::step() noexcept
{
    if (shutdown_.is_cancelled()) {
        return model::StepResult::Stop;
    }

    auto command = inbound_.recv();
    if (!command) {
        LOG(INFO) << "inbound command stream closed, shutting down";
        shutdown_.cancel();
        return model::StepResult::Stop;
    }

    const bool droppable = model::classify(*command) == model::DeliveryClass::Droppable;
    const bool sent = droppable ? droppable_.send(std::move(*command))
                                : guaranteed_.send(std::move(*command));
    CHECK(sent) << (droppable ? "droppable" : "guaranteed")
                << " channel closed while the router is running";

    (droppable ? routed_droppable_ : routed_guaranteed_)
        .fetch_add(1, std::memory_order_relaxed);
    return model::StepResult::Continue;
}

void Router::done() noexcept
{
    droppable_.close();
    guaranteed_.close();
}

} // namespace cmdpipe::modules::dispatch
