#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include "cmdpipe/cmdpipe.hpp"

namespace cmdpipe::modules::settings {

using SettingValue = std::variant<bool, int64_t, double, std::string>;

enum class SettingKind : uint8_t {
    Global,  // remote global variable, g:<name>
    Option,  // remote editor option, &<name>
};

template <class T>
concept SettingType =
    std::same_as<T, bool> || std::same_as<T, int64_t> ||
    std::same_as<T, double> || std::same_as<T, std::string>;

// Converts a remote value to T. Integers widen to double; nothing else
// converts.
template <SettingType T>
[[nodiscard]] std::optional<T> setting_cast(const SettingValue& value)
{
    if (const auto* exact = std::get_if<T>(&value)) {
        return *exact;
    }
    if constexpr (std::same_as<T, double>) {
        if (const auto* integer = std::get_if<int64_t>(&value)) {
            return static_cast<double>(*integer);
        }
    }
    return std::nullopt;
}

/*
 * SettingsRegistry - remote setting name -> typed reader/updater pair.
 *
 * Filled by explicit calls at startup. Readers and updaters run under the
 * registry lock and must not call back into the registry.
 */
class SettingsRegistry final {
public:
    using Reader  = std::function<SettingValue()>;
    using Updater = std::function<bool(const SettingValue&)>;

    // false when the name is already registered.
    [[nodiscard]] bool register_global(std::string name, Reader reader, Updater updater);
    [[nodiscard]] bool register_option(std::string name, Reader reader, Updater updater);

    // false for an unknown name or a value of the wrong type.
    [[nodiscard]] bool update(std::string_view name, const SettingValue& value);

    [[nodiscard]] std::optional<SettingValue> read(std::string_view name) const;
    [[nodiscard]] std::optional<SettingKind> kind(std::string_view name) const;

    // Sorted.
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::size_t size() const;

    // "g:<name>" or "&<name>", as used in remote expressions.
    [[nodiscard]] static std::string remote_expression(std::string_view name, SettingKind kind);

private:
    struct Entry {
        SettingKind kind;
        Reader      reader;
        Updater     updater;
    };

    bool add(std::string name, SettingKind kind, Reader reader, Updater updater);

    mutable std::mutex                        mutex_;
    std::map<std::string, Entry, std::less<>> entries_;
};

/*
 * SettingGroup - binds fields of one settings struct under a common prefix.
 *
 *   SettingGroup group(registry, "neovide");
 *   group.field("refresh_rate", s.refresh_rate);   // g:neovide_refresh_rate
 *   group.global("transparency", s.transparency);  // g:transparency
 *   group.option("mouse", s.mouse);                // &mouse
 *
 * Bound storage must outlive the registry and is only touched through it.
 */
class SettingGroup final {
public:
    SettingGroup(SettingsRegistry& registry, std::string prefix)
        : registry_(registry), prefix_(std::move(prefix)) {}

    template <SettingType T>
    [[nodiscard]] bool field(std::string_view name, T& storage) {
        return registry_.register_global(qualified(name), reader_for(storage), updater_for(storage));
    }

    template <SettingType T>
    [[nodiscard]] bool global(std::string name, T& storage) {
        return registry_.register_global(std::move(name), reader_for(storage), updater_for(storage));
    }

    template <SettingType T>
    [[nodiscard]] bool option(std::string name, T& storage) {
        return registry_.register_option(std::move(name), reader_for(storage), updater_for(storage));
    }

    // "<prefix>_<name>", or just <name> without a prefix.
    [[nodiscard]] std::string qualified(std::string_view name) const {
        if (prefix_.empty()) {
            return std::string(name);
        }
        std::string out;
        out.reserve(prefix_.size() + 1 + name.size());
        out.append(prefix_).append("_").append(name);
        return out;
    }

private:
    template <SettingType T>
    static SettingsRegistry::Reader reader_for(T& storage) {
        return [&storage] { return SettingValue(storage); };
    }

    template <SettingType T>
    static SettingsRegistry::Updater updater_for(T& storage) {
        return [&storage](const SettingValue& value) {
            auto converted = setting_cast<T>(value);
            if (!converted) {
                return false;
            }
            storage = std::move(*converted);
            return true;
        };
    }

    SettingsRegistry& registry_;
    std::string       prefix_;
};

} // namespace cmdpipe::modules::settings
