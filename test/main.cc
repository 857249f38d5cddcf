//
// Main entry point for the doctest runner.
// Test cases live in the test/<area>/test_*.cc files linked into this executable.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>
