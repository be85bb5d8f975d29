/*
 * settings_registry_test.cpp
 *
 * Tests for SettingsRegistry and SettingGroup.
 *
 * Exit code: 0 = all tests passed, non-zero = failure.
 */

#include "modules/settings/settings_registry.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <glog/logging.h>

using namespace cmdpipe::modules::settings;

// ---------------------------------------------------------------------------
// Minimal test harness (same conventions as channel_test.cpp)
// ---------------------------------------------------------------------------

static int g_total  = 0;
static int g_passed = 0;
static int g_failed = 0;

#define TEST(name) static void name()

#define RUN(name)                                          \
    do {                                                   \
        ++g_total;                                         \
        std::printf("  %-55s", #name " ");                 \
        name();                                            \
        ++g_passed;                                        \
        std::printf("PASS\n");                             \
    } while (0)

#define EXPECT(cond)                                               \
    do {                                                           \
        if (!(cond)) {                                             \
            ++g_failed;                                            \
            std::printf("FAIL\n  assertion failed: %s\n"          \
                        "  at %s:%d\n", #cond, __FILE__, __LINE__);\
            std::abort();                                          \
        }                                                          \
    } while (0)

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------

struct WindowSettings {
    int64_t     refresh_rate = 60;
    double      transparency = 1.0;
    bool        fullscreen   = false;
    std::string title        = "editor";
    bool        mouse_hide   = true;
};

// ---------------------------------------------------------------------------
// setting_cast
// ---------------------------------------------------------------------------

TEST(test_cast_exact_types) {
    EXPECT(setting_cast<bool>(SettingValue(true)) == true);
    EXPECT(setting_cast<int64_t>(SettingValue(int64_t{42})) == int64_t{42});
    EXPECT(setting_cast<std::string>(SettingValue(std::string("x"))) == std::string("x"));
}

TEST(test_cast_widens_integer_to_double) {
    const auto widened = setting_cast<double>(SettingValue(int64_t{3}));
    EXPECT(widened.has_value());
    EXPECT(*widened == 3.0);
}

TEST(test_cast_rejects_other_conversions) {
    EXPECT(!setting_cast<int64_t>(SettingValue(2.5)).has_value());
    EXPECT(!setting_cast<bool>(SettingValue(int64_t{1})).has_value());
    EXPECT(!setting_cast<std::string>(SettingValue(true)).has_value());
}

// ---------------------------------------------------------------------------
// SettingGroup
// ---------------------------------------------------------------------------

TEST(test_group_prefixes_fields) {
    SettingsRegistry registry;
    WindowSettings s;
    SettingGroup group(registry, "neovide");

    EXPECT(group.field("refresh_rate", s.refresh_rate));
    EXPECT(group.qualified("refresh_rate") == "neovide_refresh_rate");
    EXPECT(registry.kind("neovide_refresh_rate") == SettingKind::Global);
    EXPECT(!registry.kind("refresh_rate").has_value());
}

TEST(test_group_without_prefix) {
    SettingsRegistry registry;
    SettingGroup group(registry, "");
    EXPECT(group.qualified("title") == "title");
}

TEST(test_group_global_and_option_names_are_verbatim) {
    SettingsRegistry registry;
    WindowSettings s;
    SettingGroup group(registry, "neovide");

    EXPECT(group.global("transparency", s.transparency));
    EXPECT(group.option("mousehide", s.mouse_hide));
    EXPECT(registry.kind("transparency") == SettingKind::Global);
    EXPECT(registry.kind("mousehide") == SettingKind::Option);
}

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

TEST(test_update_then_read) {
    SettingsRegistry registry;
    WindowSettings s;
    SettingGroup group(registry, "neovide");
    EXPECT(group.field("refresh_rate", s.refresh_rate));
    EXPECT(group.field("title", s.title));

    EXPECT(registry.update("neovide_refresh_rate", SettingValue(int64_t{144})));
    EXPECT(s.refresh_rate == 144);
    EXPECT(registry.update("neovide_title", SettingValue(std::string("notes"))));
    EXPECT(s.title == "notes");

    const auto value = registry.read("neovide_refresh_rate");
    EXPECT(value.has_value());
    EXPECT(std::get<int64_t>(*value) == 144);
}

TEST(test_update_with_wrong_type_keeps_value) {
    SettingsRegistry registry;
    WindowSettings s;
    SettingGroup group(registry, "neovide");
    EXPECT(group.field("fullscreen", s.fullscreen));

    EXPECT(!registry.update("neovide_fullscreen", SettingValue(std::string("yes"))));
    EXPECT(s.fullscreen == false);
}

TEST(test_update_widens_integer_for_double_field) {
    SettingsRegistry registry;
    WindowSettings s;
    SettingGroup group(registry, "neovide");
    EXPECT(group.field("transparency", s.transparency));

    EXPECT(registry.update("neovide_transparency", SettingValue(int64_t{0})));
    EXPECT(s.transparency == 0.0);
}

TEST(test_unknown_setting) {
    SettingsRegistry registry;
    EXPECT(!registry.update("neovide_nothing", SettingValue(true)));
    EXPECT(!registry.read("neovide_nothing").has_value());
    EXPECT(!registry.kind("neovide_nothing").has_value());
}

TEST(test_duplicate_registration_rejected) {
    SettingsRegistry registry;
    WindowSettings a;
    WindowSettings b;
    SettingGroup first(registry, "neovide");
    SettingGroup second(registry, "neovide");

    EXPECT(first.field("fullscreen", a.fullscreen));
    EXPECT(!second.field("fullscreen", b.fullscreen));
    EXPECT(registry.size() == 1u);

    // the first binding still owns the name
    EXPECT(registry.update("neovide_fullscreen", SettingValue(true)));
    EXPECT(a.fullscreen == true);
    EXPECT(b.fullscreen == false);
}

TEST(test_names_are_sorted) {
    SettingsRegistry registry;
    WindowSettings s;
    SettingGroup group(registry, "neovide");
    EXPECT(group.field("title", s.title));
    EXPECT(group.field("fullscreen", s.fullscreen));
    EXPECT(group.option("mousehide", s.mouse_hide));

    const std::vector<std::string> expected{
        "mousehide", "neovide_fullscreen", "neovide_title"};
    EXPECT(registry.names() == expected);
}

TEST(test_remote_expression) {
    EXPECT(SettingsRegistry::remote_expression("neovide_title", SettingKind::Global) ==
           "g:neovide_title");
    EXPECT(SettingsRegistry::remote_expression("mouse", SettingKind::Option) == "&mouse");
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int, char** argv) {
    FLAGS_logtostderr = true;
    google::InitGoogleLogging(argv[0]);

    std::printf("=== settings registry tests ===\n\n");

    std::printf("--- setting_cast ---\n");
    RUN(test_cast_exact_types);
    RUN(test_cast_widens_integer_to_double);
    RUN(test_cast_rejects_other_conversions);

    std::printf("\n--- SettingGroup ---\n");
    RUN(test_group_prefixes_fields);
    RUN(test_group_without_prefix);
    RUN(test_group_global_and_option_names_are_verbatim);

    std::printf("\n--- SettingsRegistry ---\n");
    RUN(test_update_then_read);
    RUN(test_update_with_wrong_type_keeps_value);
    RUN(test_update_widens_integer_for_double_field);
    RUN(test_unknown_setting);
    RUN(test_duplicate_registration_rejected);
    RUN(test_names_are_sorted);
    RUN(test_remote_expression);

    std::printf("\n=== Results: %d/%d passed ===\n", g_passed, g_total);
    return (g_failed == 0) ? 0 : 1;
}
