#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include "cmdpipe/cmdpipe.hpp"
#include "model/tags.hpp"

namespace cmdpipe::model {

// (column, row) on a remote grid.
struct GridPosition {
    uint32_t column{0};
    uint32_t row{0};
    bool operator==(const GridPosition&) const noexcept = default;
};

enum class MouseAction : uint8_t { Press, Release };
enum class ScrollDirection : uint8_t { Up, Down, Left, Right };

// Names as the remote protocol spells them.
[[nodiscard]] std::string_view to_string(MouseAction action) noexcept;
[[nodiscard]] std::string_view to_string(ScrollDirection direction) noexcept;

// ============================================================================
// Command alternatives
// ============================================================================

struct Quit {
    using delivery = guaranteed_tag;
    bool operator==(const Quit&) const noexcept = default;
};

struct Resize {
    using delivery = droppable_tag;
    uint32_t width{0};
    uint32_t height{0};
    bool operator==(const Resize&) const noexcept = default;
};

struct Keyboard {
    using delivery = guaranteed_tag;
    std::string input;  // input notation, forwarded verbatim
    bool operator==(const Keyboard&) const = default;
};

struct MouseButton {
    using delivery = guaranteed_tag;
    MouseAction action{MouseAction::Press};
    uint64_t grid_id{0};
    GridPosition position{};
    bool operator==(const MouseButton&) const noexcept = default;
};

struct Scroll {
    using delivery = droppable_tag;
    ScrollDirection direction{ScrollDirection::Down};
    uint64_t grid_id{0};
    GridPosition position{};
    bool operator==(const Scroll&) const noexcept = default;
};

struct Drag {
    using delivery = droppable_tag;
    uint64_t grid_id{0};
    GridPosition position{};
    bool operator==(const Drag&) const noexcept = default;
};

struct FileDrop {
    using delivery = guaranteed_tag;
    std::string path;
    bool operator==(const FileDrop&) const = default;
};

struct FocusLost {
    using delivery = guaranteed_tag;
    bool operator==(const FocusLost&) const noexcept = default;
};

struct FocusGained {
    using delivery = guaranteed_tag;
    bool operator==(const FocusGained&) const noexcept = default;
};

// Platform shell integration (context-menu entries).
struct RegisterShellIntegration {
    using delivery = guaranteed_tag;
    bool operator==(const RegisterShellIntegration&) const noexcept = default;
};

struct UnregisterShellIntegration {
    using delivery = guaranteed_tag;
    bool operator==(const UnregisterShellIntegration&) const noexcept = default;
};

using Command = std::variant<
    Quit,
    Resize,
    Keyboard,
    MouseButton,
    Scroll,
    Drag,
    FileDrop,
    FocusLost,
    FocusGained,
    RegisterShellIntegration,
    UnregisterShellIntegration>;

static_assert(all_classified<Command>::value,
              "every Command alternative must declare exactly one delivery class");

// ============================================================================
// Classification
// ============================================================================

// Total, pure, stable for the process lifetime. Depends on the tag only.
[[nodiscard]] DeliveryClass classify(const Command& command) noexcept;

// Stable short name of the alternative ("resize", "keyboard", ...).
[[nodiscard]] std::string_view command_name(const Command& command) noexcept;

// Human readable one-liner for logs.
[[nodiscard]] std::string describe(const Command& command);

} // namespace cmdpipe::model
