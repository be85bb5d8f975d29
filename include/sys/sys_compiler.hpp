#pragma once

#if defined(__clang__)
  #define CMDPIPE_COMPILER_CLANG 1
#else
  #define CMDPIPE_COMPILER_CLANG 0
#endif

#if defined(__GNUC__) && !CMDPIPE_COMPILER_CLANG
  #define CMDPIPE_COMPILER_GCC 1
#else
  #define CMDPIPE_COMPILER_GCC 0
#endif

// likely/unlikely
#if (CMDPIPE_COMPILER_GCC || CMDPIPE_COMPILER_CLANG)
  #define CMDPIPE_LIKELY(x)   __builtin_expect(!!(x), 1)
  #define CMDPIPE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
  #define CMDPIPE_LIKELY(x)   (x)
  #define CMDPIPE_UNLIKELY(x) (x)
#endif
