// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#pragma once

// Wrap fmt and absl includes so their warnings do not leak into our -Werror builds.
#ifdef _MSC_VER
#define VD_BEGIN_THIRD_PARTY_INCLUDES                                           \
  __pragma(warning(push)) __pragma(warning(disable : 4127)) /* constant if */   \
      __pragma(warning(disable : 4324))                     /* padding */       \
      __pragma(warning(disable : 4582))                     /* union ctor */    \
      __pragma(warning(disable : 4583))                     /* union dtor */
#define VD_END_THIRD_PARTY_INCLUDES __pragma(warning(pop))
#elif defined(__clang__)
#define VD_BEGIN_THIRD_PARTY_INCLUDES \
  _Pragma("clang diagnostic push") _Pragma("clang diagnostic ignored \"-Wpedantic\"")
#define VD_END_THIRD_PARTY_INCLUDES _Pragma("clang diagnostic pop")
#elif defined(__GNUC__)
#define VD_BEGIN_THIRD_PARTY_INCLUDES \
  _Pragma("GCC diagnostic push") _Pragma("GCC diagnostic ignored \"-Wpedantic\"")
#define VD_END_THIRD_PARTY_INCLUDES _Pragma("GCC diagnostic pop")
#else
#define VD_BEGIN_THIRD_PARTY_INCLUDES
#define VD_END_THIRD_PARTY_INCLUDES
#endif
