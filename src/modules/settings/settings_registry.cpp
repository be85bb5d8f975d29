#include "modules/settings/settings_registry.hpp"

#include <glog/logging.h>

namespace cmdpipe::modules::settings {

bool SettingsRegistry::register_global(std::string name, Reader reader, Updater updater)
{
    return add(std::move(name), SettingKind::Global, std::move(reader), std::move(updater));
}

bool SettingsRegistry::register_option(std::string name, Reader reader, Updater updater)
{
    return add(std::move(name), SettingKind::Option, std::move(reader), std::move(updater));
}

bool SettingsRegistry::add(std::string name, SettingKind kind, Reader reader, Updater updater)
{
    CHECK(reader && updater) << "setting " << name << " registered without handlers";

    std::lock_guard lock(mutex_);
    const auto [it, inserted] =
        entries_.try_emplace(std::move(name), Entry{kind, std::move(reader), std::move(updater)});
    if (!inserted) {
        LOG(WARNING) << "setting " << it->first << " is already registered";
        return false;
    }
    VLOG(CMDPIPE_TRACE_VLOG_LEVEL) << "registered setting " << remote_expression(it->first, kind);
    return true;
}

bool SettingsRegistry::update(std::string_view name, const SettingValue& value)
{
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        VLOG(CMDPIPE_TRACE_VLOG_LEVEL) << "ignoring update of unknown setting " << name;
        return false;
    }
    if (!it->second.updater(value)) {
        LOG(WARNING) << "setting " << name << " rejected a value of the wrong type";
        return false;
    }
    return true;
}

std::optional<SettingValue> SettingsRegistry::read(std::string_view name) const
{
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.reader();
}

std::optional<SettingKind> SettingsRegistry::kind(std::string_view name) const
{
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.kind;
}

std::vector<std::string> SettingsRegistry::names() const
{
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        out.push_back(name);
    }
    return out;
}

std::size_t SettingsRegistry::size() const
{
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::string SettingsRegistry::remote_expression(std::string_view name, SettingKind kind)
{
    std::string out(kind == SettingKind::Global ? "g:" : "&");
    out.append(name);
    return out;
}

} // namespace cmdpipe::modules::settings
