#include "modules/remote/execution.hpp"

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <glog/logging.h>

namespace cmdpipe::modules::remote {

std::string_view to_string(CallStatus status) noexcept
{
    switch (status) {
    case CallStatus::Ok:           return "ok";
    case CallStatus::Rejected:     return "rejected";
    case CallStatus::Disconnected: return "disconnected";
    }
    return "unknown";
}

namespace {

constexpr std::string_view kRegisterFailed =
    "Could not register context menu items. "
    "Possibly already registered or not running as Admin?";
constexpr std::string_view kUnregisterFailed =
    "Could not remove context menu items. "
    "Possibly already removed or not running as Admin?";

ExecOutcome require(const CallResult& result, std::string_view what)
{
    if (CMDPIPE_LIKELY(result.ok())) {
        return ExecOutcome::Completed;
    }
    LOG(ERROR) << what << " failed (" << to_string(result.status) << "): " << result.detail;
    return ExecOutcome::Aborted;
}

void report_integration_failure(RemoteSession& session, std::string_view message)
{
    LOG(ERROR) << message;
    // The session may be the thing that is broken; nothing more to do.
    (void)session.err_writeln(message);
}

int64_t to_remote(uint64_t value) noexcept { return static_cast<int64_t>(value); }

class Executor {
public:
    explicit Executor(const ExecutionContext& context) noexcept
        : ctx_(context), session_(*context.session) {}

    ExecOutcome operator()(const model::Quit&)
    {
        (void)session_.command(kQuitCommand);
        return ExecOutcome::Completed;
    }

    ExecOutcome operator()(const model::Resize& c)
    {
        const auto width  = std::max(c.width, ctx_.min_width);
        const auto height = std::max(c.height, ctx_.min_height);
        return require(session_.ui_try_resize(width, height), "Resize");
    }

    ExecOutcome operator()(const model::Keyboard& c)
    {
        VLOG(CMDPIPE_TRACE_VLOG_LEVEL) << "Keyboard Input Sent: " << c.input;
        return require(session_.input(c.input), "Input");
    }

    ExecOutcome operator()(const model::MouseButton& c)
    {
        return require(session_.input_mouse("left", model::to_string(c.action), "",
                                            to_remote(c.grid_id), c.position.row,
                                            c.position.column),
                       "Mouse Input");
    }

    ExecOutcome operator()(const model::Scroll& c)
    {
        return require(session_.input_mouse("wheel", model::to_string(c.direction), "",
                                            to_remote(c.grid_id), c.position.row,
                                            c.position.column),
                       "Mouse Scroll");
    }

    ExecOutcome operator()(const model::Drag& c)
    {
        return require(session_.input_mouse("left", "drag", "", to_remote(c.grid_id),
                                            c.position.row, c.position.column),
                       "Mouse Drag");
    }

    ExecOutcome operator()(const model::FocusLost&)
    {
        return require(session_.command(kFocusLostCommand), "Focus Lost");
    }

    ExecOutcome operator()(const model::FocusGained&)
    {
        return require(session_.command(kFocusGainedCommand), "Focus Gained");
    }

    ExecOutcome operator()(const model::FileDrop& c)
    {
        (void)session_.command(fmt::format("e {}", c.path));
        return ExecOutcome::Completed;
    }

    ExecOutcome operator()(const model::RegisterShellIntegration&)
    {
        if (!shell_available()) {
            return ExecOutcome::Completed;
        }
        if (!ctx_.shell->register_entries()) {
            report_integration_failure(session_, kRegisterFailed);
        }
        return ExecOutcome::Completed;
    }

    ExecOutcome operator()(const model::UnregisterShellIntegration&)
    {
        if (!shell_available()) {
            return ExecOutcome::Completed;
        }
        if (!ctx_.shell->unregister_entries()) {
            report_integration_failure(session_, kUnregisterFailed);
        }
        return ExecOutcome::Completed;
    }

private:
    bool shell_available() const
    {
        if (ctx_.shell) {
            return true;
        }
        LOG(WARNING) << "shell integration is not available on " << CMDPIPE_OS_NAME;
        return false;
    }

    const ExecutionContext& ctx_;
    RemoteSession& session_;
};

// A new alternative without an Executor overload must not compile silently.
template <class Variant>
struct executable_by;

template <class... Ts>
struct executable_by<std::variant<Ts...>>
    : std::bool_constant<(std::is_invocable_r_v<ExecOutcome, Executor&, const Ts&> && ...)> {};

static_assert(executable_by<model::Command>::value,
              "every Command alternative needs an Executor overload");

} // namespace

ExecOutcome execute(model::Command command, const ExecutionContext& context)
{
    CHECK(context.session) << "execution without a remote session";
    Executor executor(context);
    return std::visit(executor, command);
}

} // namespace cmdpipe::modules::remote
