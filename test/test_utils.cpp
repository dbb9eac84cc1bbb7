#include "test_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace folio::test::utils {

fs::path createTempDir() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string dirname = "folio_test_";
    for (int i = 0; i < 8; ++i) {
        dirname += "0123456789abcdef"[dis(gen)];
    }

    fs::path tempDir = fs::temp_directory_path() / dirname;
    fs::create_directories(tempDir);
    return tempDir;
}

void removeDir(const fs::path& dir) {
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(dir, ec);
    }
}

fs::path createFile(
    const fs::path& baseDir,
    const std::string& filename,
    const std::string& content
) {
    fs::path filePath = baseDir / filename;

    // Create parent directories if needed
    fs::create_directories(filePath.parent_path());

    std::ofstream file(filePath, std::ios::binary);
    file << content;
    file.close();

    return filePath;
}

void createFiles(
    const fs::path& baseDir,
    const std::vector<std::pair<std::string, std::string>>& files
) {
    for (const auto& [filename, content] : files) {
        createFile(baseDir, filename, content);
    }
}

std::string readFile(const fs::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

fs::path createScript(const fs::path& baseDir, const std::string& filename, const std::string& body) {
    fs::path script = createFile(baseDir, filename, "#!/bin/sh\n" + body);
    fs::permissions(script, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    return script;
}

fs::path createFakePandoc(const fs::path& baseDir) {
    return createScript(baseDir, "fake-pandoc.sh",
        "in=\"$1\"\n"
        "out=\"\"\n"
        "title=\"\"\n"
        "for arg in \"$@\"; do\n"
        "  case \"$arg\" in\n"
        "    --output=*) out=\"${arg#--output=}\" ;;\n"
        "    --metadata=pagetitle:*) title=\"${arg#--metadata=pagetitle:}\" ;;\n"
        "  esac\n"
        "done\n"
        "if grep -q INVALID \"$in\"; then\n"
        "  echo \"cannot parse $in\" >&2\n"
        "  exit 3\n"
        "fi\n"
        "{ echo \"<title>$title</title>\"; cat \"$in\"; } > \"$out\"\n");
}

std::vector<std::string> listFiles(const fs::path& root) {
    std::vector<std::string> out;
    if (!fs::exists(root)) return out;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            out.push_back(entry.path().lexically_relative(root).generic_string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string post(const std::string& title, const std::string& date, const std::string& extra) {
    return "---\ntitle: " + title + "\ndate: " + date + "\n" + extra + "---\n\nBody of " + title + ".\n";
}

fs::path getCwd() {
    return fs::current_path();
}

void setCwd(const fs::path& dir) {
    fs::current_path(dir);
}

} // namespace folio::test::utils
