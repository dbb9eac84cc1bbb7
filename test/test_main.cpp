#include <gtest/gtest.h>

#include <cstdlib>

#include "util/Logger.hpp"

/**
 * @brief Main entry point for folio unit tests
 *
 * Run with: ./folio_tests
 * Or with CMake CTest: ctest --output-on-failure
 *
 * Logging is limited to errors unless FOLIO_LOG asks for more.
 */

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    if (!std::getenv("FOLIO_LOG")) {
        folio::Logger::instance().setLevel(folio::LogLevel::Error);
    }
    return RUN_ALL_TESTS();
}
