#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include "cmdpipe/cmdpipe.hpp"

namespace cmdpipe::modules::remote {

enum class CallStatus : uint8_t {
    Ok,
    Rejected,      // the session answered with an error
    Disconnected,  // no answer: the session is gone
};

struct CallResult {
    CallStatus  status{CallStatus::Ok};
    std::string detail;  // diagnostic from the session, empty on success

    [[nodiscard]] bool ok() const noexcept { return status == CallStatus::Ok; }

    [[nodiscard]] static CallResult success() { return {}; }
    [[nodiscard]] static CallResult failure(CallStatus status, std::string detail) {
        return CallResult{status, std::move(detail)};
    }
};

[[nodiscard]] std::string_view to_string(CallStatus status) noexcept;

/*
 * RemoteSession - procedure-call surface of the editor process.
 *
 * Implementations own the wire encoding and the connection. Every method
 * performs one call and returns when the session answered or failed.
 * Implementations MUST tolerate concurrent calls from several threads
 * without mixing up request/response correlation.
 *
 * Integers are signed 64-bit as the remote protocol expects; strings are
 * passed verbatim.
 */
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Ex-command line ("qa!", "e <path>", ...).
    virtual CallResult command(std::string_view text) = 0;

    virtual CallResult ui_try_resize(int64_t width, int64_t height) = 0;

    // Keys in input notation ("<C-w>", "ihello<Esc>", ...).
    virtual CallResult input(std::string_view keys) = 0;

    virtual CallResult input_mouse(std::string_view button,
                                   std::string_view action,
                                   std::string_view modifier,
                                   int64_t grid,
                                   int64_t row,
                                   int64_t col) = 0;

    // Message on the session's error channel.
    virtual CallResult err_writeln(std::string_view text) = 0;
};

} // namespace cmdpipe::modules::remote
