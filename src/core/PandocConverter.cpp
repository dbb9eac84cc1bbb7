#include "core/PandocConverter.hpp"

#include <filesystem>
#include <utility>

#include "util/Process.hpp"

namespace fs = std::filesystem;

namespace folio {

PandocConverter::PandocConverter(std::string executable, std::chrono::seconds timeout)
    : executable(std::move(executable)), timeout(timeout) {}

std::vector<std::string> PandocConverter::commandLine(const ConversionJob& job) const {
    std::vector<std::string> argv{
        executable,
        job.source.string(),
        "--from=markdown",
        "--to=html5",
        "--standalone",
        "--embed-resources",
        // Relative image links resolve against the post's own directory
        "--resource-path=" + job.source.parent_path().string(),
        // <title> fallback for posts without front-matter
        "--metadata=pagetitle:" + job.frontMatter.title,
    };
    if (!job.templatePath.empty()) argv.push_back("--template=" + job.templatePath.string());
    if (!job.metadataPath.empty()) argv.push_back("--metadata-file=" + job.metadataPath.string());
    if (job.frontMatter.generateToc) argv.emplace_back("--toc");
    argv.push_back("--output=" + job.destination.string());
    return argv;
}

Expected<void> PandocConverter::convert(const ConversionJob& job) const {
    auto res = runProcess(commandLine(job), timeout);
    if (!res) return res.error();

    const ProcessResult& pr = res.value();
    if (pr.exitStatus != 0) {
        std::string msg = executable + " exited with status " + std::to_string(pr.exitStatus);
        if (!pr.stderrText.empty()) {
            std::string detail = pr.stderrText;
            while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) detail.pop_back();
            msg += ": " + detail;
        }
        return Error{ErrorCode::ConversionFailed, msg};
    }

    std::error_code ec;
    if (!fs::is_regular_file(job.destination, ec)) {
        return Error{ErrorCode::ConversionFailed, executable + " reported success but wrote no output"};
    }
    return {};
}

}
