#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include "cmdpipe/cmdpipe.hpp"
#include "model/command.hpp"
#include "modules/remote/remote_session.hpp"
#include "modules/remote/shell_integration.hpp"

namespace cmdpipe::modules::remote {

enum class ExecOutcome : uint8_t {
    Completed,  // the call succeeded, or failed under a best-effort policy
    Aborted,    // a must-succeed call failed; this execution is abandoned
};

// Everything one execution needs. Cheap to copy: handles are shared.
struct ExecutionContext {
    std::shared_ptr<RemoteSession>    session;
    std::shared_ptr<ShellIntegration> shell;  // null where the platform has none
    uint32_t min_width{CMDPIPE_MIN_RESIZE_WIDTH};
    uint32_t min_height{CMDPIPE_MIN_RESIZE_HEIGHT};
};

// Remote commands issued for focus changes. Only fire the user's
// autocommands when some are registered.
inline constexpr std::string_view kFocusLostCommand =
    "if exists('#FocusLost') | doautocmd <nomodeline> FocusLost | endif";
inline constexpr std::string_view kFocusGainedCommand =
    "if exists('#FocusGained') | doautocmd <nomodeline> FocusGained | endif";
inline constexpr std::string_view kQuitCommand = "qa!";

/*
 * Performs the remote call(s) for one command.
 *
 * Failure policy per command:
 *  - Quit, FileDrop: best-effort, result ignored
 *  - Resize, Keyboard, MouseButton, Scroll, Drag, FocusLost, FocusGained:
 *    must succeed; a failure is logged at ERROR and reported as Aborted
 *  - shell integration: failures logged and echoed on the session's error
 *    channel; never Aborted
 *
 * Never retries. Never throws for a failed call.
 */
ExecOutcome execute(model::Command command, const ExecutionContext& context);

} // namespace cmdpipe::modules::remote
