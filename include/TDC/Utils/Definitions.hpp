#pragma once

// Fixes conflict in Windows with <windows.h>
#ifdef _WIN32
  #undef ERROR
#endif

#if defined(_WIN64) || defined(__x86_64__) || defined(__amd64__) || defined(__aarch64__) || defined(__ia64__) || defined(__ppc64__) || defined(__powerpc64__) || defined(__mips64) || defined(__LP64__)
  #define TDC_ARCH_64BIT 1
#else
  #define TDC_ARCH_64BIT 0
#endif

#ifndef TDC_VERSION
  #define TDC_VERSION "0.0.0"
#endif

/// Macro alias for trailing return type functions.
#define fn auto
