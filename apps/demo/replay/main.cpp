// Replays command lines from stdin through a live pipeline. The remote
// session prints every call it receives instead of talking to an editor.
//
//   printf 'resize 5 1\nkey ihello<Esc>\nquit\n' | cmdpipe_replay --workers=2 --verbose=1

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <glog/logging.h>

#include "cmdpipe/cmdpipe.hpp"
#include "exec/primitives/channel.hpp"
#include "model/command.hpp"
#include "model/command_text.hpp"
#include "modules/dispatch/pipeline.hpp"
#include "modules/remote/remote_session.hpp"

using namespace cmdpipe;

namespace {

class PrintingSession final : public modules::remote::RemoteSession {
public:
    using CallResult = modules::remote::CallResult;

    CallResult command(std::string_view text) override {
        return print(fmt::format("command \"{}\"", text));
    }
    CallResult ui_try_resize(int64_t width, int64_t height) override {
        return print(fmt::format("ui_try_resize {} {}", width, height));
    }
    CallResult input(std::string_view keys) override {
        return print(fmt::format("input \"{}\"", keys));
    }
    CallResult input_mouse(std::string_view button, std::string_view action,
                           std::string_view modifier, int64_t grid, int64_t row,
                           int64_t col) override {
        return print(fmt::format("input_mouse {} {} \"{}\" grid={} row={} col={}", button,
                                 action, modifier, grid, row, col));
    }
    CallResult err_writeln(std::string_view text) override {
        return print(fmt::format("err_writeln \"{}\"", text));
    }

private:
    CallResult print(const std::string& line) {
        std::lock_guard lock(mutex_);
        std::printf("-> %s\n", line.c_str());
        std::fflush(stdout);
        return CallResult::success();
    }

    std::mutex mutex_;
};

bool parse_flag(std::string_view arg, std::string_view name, long& out)
{
    const std::string prefix = fmt::format("--{}=", name);
    if (arg.substr(0, prefix.size()) != prefix) {
        return false;
    }
    const std::string value(arg.substr(prefix.size()));
    char* end = nullptr;
    out = std::strtol(value.c_str(), &end, 10);
    return end != value.c_str() && *end == '\0';
}

} // namespace

int main(int argc, char** argv)
{
    FLAGS_logtostderr = true;
    google::InitGoogleLogging(argv[0]);

    modules::dispatch::PipelineConfig config{};
    for (int i = 1; i < argc; ++i) {
        long value = 0;
        if (parse_flag(argv[i], "workers", value) && value > 0) {
            config.worker_threads = static_cast<std::size_t>(value);
        } else if (parse_flag(argv[i], "verbose", value) && value >= 0) {
            FLAGS_v = static_cast<int>(value);
        } else {
            std::fprintf(stderr, "usage: %s [--workers=N] [--verbose=N] < commands\n", argv[0]);
            return 2;
        }
    }

    auto [inbound_tx, inbound_rx] = exec::primitives::make_channel<model::Command>();

    modules::remote::ExecutionContext context{};
    context.session = std::make_shared<PrintingSession>();

    modules::dispatch::Pipeline pipeline(std::move(inbound_rx), context, config);
    pipeline.start();

    std::string line;
    unsigned long lineno = 0;
    while (std::getline(std::cin, line)) {
        ++lineno;
        auto command = model::parse_command(line);
        if (!command) {
            if (!line.empty() && line.front() != '#') {
                LOG(WARNING) << "line " << lineno << ": cannot parse '" << line << "'";
            }
            continue;
        }
        VLOG(CMDPIPE_TRACE_VLOG_LEVEL) << "submit " << model::describe(*command);
        if (!inbound_tx.send(std::move(*command))) {
            LOG(ERROR) << "pipeline stopped accepting commands";
            break;
        }
    }

    inbound_tx.close();
    pipeline.join();
    pipeline.drain_workers();

    const auto& dropped = pipeline.droppable_stats();
    const auto& ordered = pipeline.guaranteed_stats();
    LOG(INFO) << "done: droppable received=" << dropped.received.load()
              << " coalesced=" << dropped.coalesced.load()
              << " executed=" << dropped.finished()
              << ", guaranteed executed=" << ordered.finished()
              << " aborted=" << (dropped.aborted.load() + ordered.aborted.load());
    return 0;
}
