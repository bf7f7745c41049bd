/**
 * @file test_main.cpp
 * @brief Entry point for doctree_tests
 *
 * Library code logs through spdlog; keep the default logger quiet so
 * test output only shows GoogleTest results.
 */

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::off);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
