/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * This file provides the main() function for running all GoogleTest tests.
 * Each test file registers its tests automatically via the TEST() macro.
 *
 * Diagnostics are silenced by default; tests that check log output install
 * their own sink and level.
 *
 * Build: cmake --build . --target treelink_tests
 * Run:   ./treelink_tests
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "treelink/Log.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    treelink::log::set_level(treelink::log::Level::Off);
    return RUN_ALL_TESTS();
}
