#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "core/IConverter.hpp"

namespace folio {

/**
 * @brief Converter backed by the pandoc executable
 *
 * Produces a standalone HTML5 page with images, stylesheets and scripts
 * embedded, so each output file is self-contained.
 */
class PandocConverter : public IConverter {
public:
    explicit PandocConverter(std::string executable = "pandoc",
                             std::chrono::seconds timeout = std::chrono::seconds::zero());

    Expected<void> convert(const ConversionJob& job) const override;
    const char* name() const override { return "pandoc"; }

    /// Command line used for a job (exposed for diagnostics and tests)
    std::vector<std::string> commandLine(const ConversionJob& job) const;

private:
    std::string executable;
    std::chrono::seconds timeout;
};

}
