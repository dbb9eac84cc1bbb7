#include "core/BuildPipeline.hpp"

#include <algorithm>
#include <mutex>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "core/FrontMatter.hpp"
#include "core/SourceDiscovery.hpp"
#include "util/FileIO.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace folio {

BuildPipeline::BuildPipeline(const SiteConfig& config, const IConverter& converter)
    : config(config), converter(converter) {}

Expected<void> BuildPipeline::buildOne(const fs::path& relative) const {
    fs::path source = config.contentRoot / relative;
    fs::path destination = mapOutputPath(relative, config.outputRoot, config.outputExtension);

    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "cannot create " + destination.parent_path().string() + ": " + ec.message()};
    }

    auto text = readTextFile(source);
    if (!text) return text.error();

    ConversionJob job;
    job.source = source;
    job.destination = tempPathFor(destination);
    job.templatePath = config.templatePath;
    job.metadataPath = config.metadataPath;
    job.frontMatter = FrontMatter::defaultsFor(source);

    // The converter reads the block itself; folio only needs the title and TOC flag
    auto fm = parseFrontMatter(text.value(), job.frontMatter);
    if (fm) {
        job.frontMatter = fm.value();
    } else {
        Logger::instance().warn(relative.generic_string() + ": " + fm.error().message + ", using defaults");
    }

    // A staging file from an interrupted run must not be mistaken for fresh output
    fs::remove(job.destination, ec);

    auto converted = converter.convert(job);
    if (!converted) {
        fs::remove(job.destination, ec);
        return converted.error();
    }

    fs::rename(job.destination, destination, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(job.destination, ignored);
        return Error{ErrorCode::IoError, "cannot move output into place: " + ec.message()};
    }
    return {};
}

BuildReport BuildPipeline::run(const std::vector<fs::path>& sources, const std::atomic<bool>& cancel) const {
    BuildReport report;
    report.discovered = sources.size();
    if (sources.empty()) return report;

    std::mutex reportMtx;
    size_t workers = std::min(std::max<size_t>(config.jobs, 1), sources.size());
    Logger::instance().debug("converting " + std::to_string(sources.size()) + " file(s) on " +
                             std::to_string(workers) + " worker(s) with " + converter.name());

    boost::asio::thread_pool pool(workers);
    for (const auto& rel : sources) {
        boost::asio::post(pool, [this, &rel, &cancel, &report, &reportMtx] {
            Expected<void> res = Error{ErrorCode::Cancelled, "cancelled"};
            if (!cancel.load()) {
                try {
                    res = buildOne(rel);
                } catch (const std::exception& e) {
                    res = Error{ErrorCode::InternalError, e.what()};
                }
            }

            std::scoped_lock lock(reportMtx);
            if (res) {
                ++report.built;
                Logger::instance().debug("built " + rel.generic_string());
            } else {
                Logger::instance().error(rel.generic_string() + ": " + res.error().message);
                report.failures.push_back(BuildFailure{rel, res.error()});
            }
        });
    }
    pool.join();

    std::sort(report.failures.begin(), report.failures.end(),
              [](const BuildFailure& a, const BuildFailure& b) {
                  return a.source.generic_string() < b.source.generic_string();
              });
    return report;
}

}
