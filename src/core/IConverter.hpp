#pragma once

#include <filesystem>

#include "core/FrontMatter.hpp"
#include "util/Expected.hpp"

namespace folio {

/// Everything a converter needs to render one content file
struct ConversionJob {
    std::filesystem::path source;        // markdown input
    std::filesystem::path destination;   // where the converter writes (a staging path)
    std::filesystem::path templatePath;  // empty = converter default
    std::filesystem::path metadataPath;  // shared site metadata, empty = none
    FrontMatter frontMatter;             // parsed metadata of the source, defaults applied
};

/**
 * @brief Strategy interface for document converters
 *
 * Allows swapping pandoc for another tool (or a fake in tests) without
 * changing the pipeline. Implementations must be safe to call concurrently
 * for different jobs.
 */
class IConverter {
public:
    virtual ~IConverter() = default;

    /// Render job.source into job.destination; error names the cause
    virtual Expected<void> convert(const ConversionJob& job) const = 0;

    /// Converter name for logs (e.g., "pandoc")
    virtual const char* name() const = 0;
};

}
