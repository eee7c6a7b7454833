#pragma once

// Include this header in exactly ONE .cpp file per test executable.
// It defines main() and hands control to the test registry. An optional
// first argument restricts the run to suites whose name contains it:
//
//   ./test_loadout decode

#include "test_framework.hpp"

auto main(int argc, char* argv[]) -> int { return ::testing::test_registry::instance().run_all(argc > 1 ? argv[1] : ""); }
