#include "model/command_text.hpp"

#include <charconv>
#include <cstdint>
#include <string>

namespace cmdpipe::model {

namespace {

constexpr std::string_view kBlanks = " \t\r\n";

std::string_view trim(std::string_view s) noexcept
{
    const auto first = s.find_first_not_of(kBlanks);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kBlanks);
    return s.substr(first, last - first + 1);
}

// Splits off the first word; `rest` receives the remainder, left-trimmed.
std::string_view next_word(std::string_view s, std::string_view& rest) noexcept
{
    s = trim(s);
    const auto end = s.find_first_of(kBlanks);
    if (end == std::string_view::npos) {
        rest = {};
        return s;
    }
    rest = trim(s.substr(end));
    return s.substr(0, end);
}

template <typename Int>
std::optional<Int> parse_int(std::string_view word) noexcept
{
    Int value{};
    const auto* first = word.data();
    const auto* last  = word.data() + word.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || word.empty()) {
        return std::nullopt;
    }
    return value;
}

// "<grid> <col> <row>" with nothing after it.
bool parse_grid_point(std::string_view s, uint64_t& grid, GridPosition& position) noexcept
{
    std::string_view rest;
    const auto g = parse_int<uint64_t>(next_word(s, rest));
    const auto c = parse_int<uint32_t>(next_word(rest, rest));
    const auto r = parse_int<uint32_t>(next_word(rest, rest));
    if (!g || !c || !r || !rest.empty()) {
        return false;
    }
    grid     = *g;
    position = GridPosition{*c, *r};
    return true;
}

} // namespace

std::optional<MouseAction> parse_mouse_action(std::string_view word) noexcept
{
    if (word == "press")   return MouseAction::Press;
    if (word == "release") return MouseAction::Release;
    return std::nullopt;
}

std::optional<ScrollDirection> parse_scroll_direction(std::string_view word) noexcept
{
    if (word == "up")    return ScrollDirection::Up;
    if (word == "down")  return ScrollDirection::Down;
    if (word == "left")  return ScrollDirection::Left;
    if (word == "right") return ScrollDirection::Right;
    return std::nullopt;
}

std::optional<Command> parse_command(std::string_view line)
{
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    std::string_view rest;
    const std::string_view verb = next_word(line, rest);

    if (verb == "quit" && rest.empty())             return Command{Quit{}};
    if (verb == "focus-lost" && rest.empty())       return Command{FocusLost{}};
    if (verb == "focus-gained" && rest.empty())     return Command{FocusGained{}};
    if (verb == "register-shell" && rest.empty())   return Command{RegisterShellIntegration{}};
    if (verb == "unregister-shell" && rest.empty()) return Command{UnregisterShellIntegration{}};

    if (verb == "key" && !rest.empty()) {
        return Command{Keyboard{std::string(rest)}};
    }
    if (verb == "drop" && !rest.empty()) {
        return Command{FileDrop{std::string(rest)}};
    }

    if (verb == "resize") {
        const auto w = parse_int<uint32_t>(next_word(rest, rest));
        const auto h = parse_int<uint32_t>(next_word(rest, rest));
        if (!w || !h || !rest.empty()) {
            return std::nullopt;
        }
        return Command{Resize{*w, *h}};
    }

    if (verb == "mouse") {
        const auto action = parse_mouse_action(next_word(rest, rest));
        MouseButton cmd{};
        if (!action || !parse_grid_point(rest, cmd.grid_id, cmd.position)) {
            return std::nullopt;
        }
        cmd.action = *action;
        return Command{cmd};
    }

    if (verb == "scroll") {
        const auto direction = parse_scroll_direction(next_word(rest, rest));
        Scroll cmd{};
        if (!direction || !parse_grid_point(rest, cmd.grid_id, cmd.position)) {
            return std::nullopt;
        }
        cmd.direction = *direction;
        return Command{cmd};
    }

    if (verb == "drag") {
        Drag cmd{};
        if (!parse_grid_point(rest, cmd.grid_id, cmd.position)) {
            return std::nullopt;
        }
        return Command{cmd};
    }

    return std::nullopt;
}

} // namespace cmdpipe::model
