#pragma once

// Fixes conflict in Windows with <windows.h>
#ifdef _WIN32
  #undef ERROR
#endif

#if defined(__unix__) || defined(__APPLE__)
  #define ARGON_POSIX 1
#else
  #define ARGON_POSIX 0
#endif

/// Macro alias for trailing return type functions.
#define fn auto
