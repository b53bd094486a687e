/**
 * Test runner for the kibitz suite. Test cases live in the *_tests.cpp files.
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
