#include "model/command.hpp"

#include <fmt/format.h>

namespace cmdpipe::model {

namespace {

template <class... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};
template <class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // namespace

std::string_view to_string(MouseAction action) noexcept
{
    switch (action) {
    case MouseAction::Press:   return "press";
    case MouseAction::Release: return "release";
    }
    return "press";
}

std::string_view to_string(ScrollDirection direction) noexcept
{
    switch (direction) {
    case ScrollDirection::Up:    return "up";
    case ScrollDirection::Down:  return "down";
    case ScrollDirection::Left:  return "left";
    case ScrollDirection::Right: return "right";
    }
    return "down";
}

DeliveryClass classify(const Command& command) noexcept
{
    return std::visit(
        [](const auto& alt) noexcept {
            return delivery_class_of<std::decay_t<decltype(alt)>>;
        },
        command);
}

std::string_view command_name(const Command& command) noexcept
{
    return std::visit(
        overloaded{
            [](const Quit&) noexcept -> std::string_view { return "quit"; },
            [](const Resize&) noexcept -> std::string_view { return "resize"; },
            [](const Keyboard&) noexcept -> std::string_view { return "keyboard"; },
            [](const MouseButton&) noexcept -> std::string_view { return "mouse"; },
            [](const Scroll&) noexcept -> std::string_view { return "scroll"; },
            [](const Drag&) noexcept -> std::string_view { return "drag"; },
            [](const FileDrop&) noexcept -> std::string_view { return "file-drop"; },
            [](const FocusLost&) noexcept -> std::string_view { return "focus-lost"; },
            [](const FocusGained&) noexcept -> std::string_view { return "focus-gained"; },
            [](const RegisterShellIntegration&) noexcept -> std::string_view {
                return "register-shell";
            },
            [](const UnregisterShellIntegration&) noexcept -> std::string_view {
                return "unregister-shell";
            },
        },
        command);
}

std::string describe(const Command& command)
{
    return std::visit(
        overloaded{
            [](const Resize& c) { return fmt::format("resize {}x{}", c.width, c.height); },
            [](const Keyboard& c) { return fmt::format("keyboard '{}'", c.input); },
            [](const MouseButton& c) {
                return fmt::format("mouse {} grid={} col={} row={}", to_string(c.action),
                                   c.grid_id, c.position.column, c.position.row);
            },
            [](const Scroll& c) {
                return fmt::format("scroll {} grid={} col={} row={}", to_string(c.direction),
                                   c.grid_id, c.position.column, c.position.row);
            },
            [](const Drag& c) {
                return fmt::format("drag grid={} col={} row={}", c.grid_id,
                                   c.position.column, c.position.row);
            },
            [](const FileDrop& c) { return fmt::format("file-drop '{}'", c.path); },
            [&command](const auto&) { return std::string(command_name(command)); },
        },
        command);
}

} // namespace cmdpipe::model
