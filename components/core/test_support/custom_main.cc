// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include <gtest/gtest.h>

#if defined(_WIN32) || defined(WIN32)
#include <Windows.h>
#endif

// Shared main for unit tests. Rendered messages contain no tabs or NULs, but string tests print
// escaped UTF-8, so the Windows console is switched to UTF-8 before running.
int main(int argc, char** argv) {
#if defined(_WIN32) || defined(WIN32)
  SetConsoleOutputCP(CP_UTF8);
  setvbuf(stdout, nullptr, _IONBF, 0);
#endif
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
