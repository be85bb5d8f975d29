#pragma once

// Project-wide umbrella: configuration knobs, platform and compiler detection.
#include "sys/sys_config.hpp"

#define CMDPIPE_VERSION_MAJOR 0
#define CMDPIPE_VERSION_MINOR 3
#define CMDPIPE_VERSION_PATCH 0

namespace cmdpipe {

inline constexpr const char* kVersionString = "0.3.0";

} // namespace cmdpipe
