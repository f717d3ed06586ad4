// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief Main entry point shared by every test layer executable.
 *
 * Runs GoogleTest, then shuts the Logger down so its worker thread drains and
 * joins before static destruction.
 */
#include "aio_service.hpp"

#include <gtest/gtest.h>

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    const int rc = RUN_ALL_TESTS();
    aiomerge::utils::Logger::instance().shutdown();
    return rc;
}
