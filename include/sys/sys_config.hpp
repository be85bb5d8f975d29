#pragma once

// 1) User override (optional).
// Picked up when the user puts the file on the include path.
#if defined(__has_include)
  #if __has_include("user_sys_config.hpp")
    #include "user_sys_config.hpp"
  #endif
#endif

// 2) Internal defaults (unless the user defined them).
#ifndef CMDPIPE_DEFAULT_WORKERS
  // Threads in the pool that runs droppable executions.
  #define CMDPIPE_DEFAULT_WORKERS 2
#endif

#ifndef CMDPIPE_MIN_RESIZE_WIDTH
  // The remote UI refuses grids narrower than this.
  #define CMDPIPE_MIN_RESIZE_WIDTH 10
#endif

#ifndef CMDPIPE_MIN_RESIZE_HEIGHT
  #define CMDPIPE_MIN_RESIZE_HEIGHT 3
#endif

#ifndef CMDPIPE_TRACE_VLOG_LEVEL
  // glog verbosity used for per-command tracing.
  #define CMDPIPE_TRACE_VLOG_LEVEL 1
#endif

static_assert(CMDPIPE_DEFAULT_WORKERS > 0, "CMDPIPE_DEFAULT_WORKERS must be positive");
static_assert(CMDPIPE_MIN_RESIZE_WIDTH > 0 && CMDPIPE_MIN_RESIZE_HEIGHT > 0,
              "resize minimums must be positive");

// 3) Platform details
#include "sys/sys_platform.hpp"
#include "sys/sys_compiler.hpp"
