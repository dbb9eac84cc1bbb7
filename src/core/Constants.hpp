#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief Site-builder constants used throughout the codebase
 *
 * Centralizes magic numbers and default names to improve maintainability.
 */
namespace folio {

namespace Constants {
    // Default site layout
    constexpr const char* DEFAULT_CONTENT_DIR = "content";
    constexpr const char* DEFAULT_OUTPUT_DIR = "public";
    constexpr const char* DEFAULT_TEMPLATE = "templates/default.html";
    constexpr const char* DEFAULT_METADATA = "metadata.yaml";
    constexpr const char* DEFAULT_PANDOC = "pandoc";
    constexpr const char* CONTENT_EXTENSION = ".md";
    constexpr const char* OUTPUT_EXTENSION = ".html";

    // Front-matter block marker (a line on its own)
    constexpr const char* FRONT_MATTER_MARKER = "---";

    // Index generation
    constexpr const char* DEFAULT_INDEX_SECTION = "posts";
    constexpr const char* DEFAULT_INDEX_FILE = "posts.md";
    constexpr const char* DEFAULT_INDEX_TITLE = "Posts";

    // Suffix for in-progress writes, renamed onto the target on success
    constexpr const char* TEMP_SUFFIX = ".tmp";

    // Converter stderr kept in failure messages
    constexpr size_t MAX_CAPTURED_STDERR = 2048;

    // Preview server
    constexpr const char* DEFAULT_SERVE_HOST = "127.0.0.1";
    constexpr uint16_t DEFAULT_SERVE_PORT = 8000;
    constexpr size_t MIN_GZIP_BYTES = 1024;

    // Process exit codes
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_BUILD_FAILED = 1;
    constexpr int EXIT_USAGE = 2;
    constexpr int EXIT_CONFIG = 3;
    constexpr int EXIT_METADATA = 4;
    constexpr int EXIT_IO = 5;
    constexpr int EXIT_INTERNAL = 6;
}
}
