#pragma once

// sys_platform.hpp
// OS detection + shell-integration availability.
// Intentionally lightweight: no heavy headers.

//------------------------------------------------------------------------------
// OS detection
//------------------------------------------------------------------------------

#if defined(_WIN32) || defined(_WIN64)
  #define CMDPIPE_OS_WINDOWS 1
#else
  #define CMDPIPE_OS_WINDOWS 0
#endif

#if defined(__linux__)
  #define CMDPIPE_OS_LINUX 1
#else
  #define CMDPIPE_OS_LINUX 0
#endif

#if defined(__APPLE__)
  #define CMDPIPE_OS_APPLE 1
#else
  #define CMDPIPE_OS_APPLE 0
#endif

#if CMDPIPE_OS_WINDOWS
  #define CMDPIPE_OS_NAME "windows"
#elif CMDPIPE_OS_APPLE
  #define CMDPIPE_OS_NAME "macos"
#elif CMDPIPE_OS_LINUX
  #define CMDPIPE_OS_NAME "linux"
#else
  #define CMDPIPE_OS_NAME "unknown"
#endif

//------------------------------------------------------------------------------
// Shell integration (explorer context-menu entries)
//------------------------------------------------------------------------------
//
// Only Windows has a native collaborator. Elsewhere the register/unregister
// commands still exist but execute against a missing collaborator and only
// log a warning. The user may force the flag in user_sys_config.hpp.
//
#ifndef CMDPIPE_HAS_SHELL_INTEGRATION
  #define CMDPIPE_HAS_SHELL_INTEGRATION CMDPIPE_OS_WINDOWS
#endif
