#pragma once

// Minimal shared header for the test runner.
//
// Individual tests use their own local SL_ASSERT macro. This file exists so
// test_main.cpp can include a stable header without depending on any test
// framework.

#include <cstdint>
#include <string>
