#pragma once
#include <optional>
#include <string_view>
#include "model/command.hpp"

namespace cmdpipe::model {

/*
 * Line notation for commands, used by the replay front-end and tests.
 *
 *   quit
 *   resize <width> <height>
 *   key <input-notation...>           rest of line, verbatim
 *   mouse <press|release> <grid> <col> <row>
 *   scroll <up|down|left|right> <grid> <col> <row>
 *   drag <grid> <col> <row>
 *   drop <path...>                    rest of line, verbatim
 *   focus-lost | focus-gained
 *   register-shell | unregister-shell
 *
 * Blank lines, '#' comments and malformed lines yield std::nullopt.
 */
[[nodiscard]] std::optional<Command> parse_command(std::string_view line);

[[nodiscard]] std::optional<MouseAction> parse_mouse_action(std::string_view word) noexcept;
[[nodiscard]] std::optional<ScrollDirection> parse_scroll_direction(std::string_view word) noexcept;

} // namespace cmdpipe::model
