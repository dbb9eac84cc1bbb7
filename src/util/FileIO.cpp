#include "util/FileIO.hpp"

#include <fstream>
#include <sstream>

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace folio {

fs::path tempPathFor(const fs::path& path) {
    return fs::path(path.string() + Constants::TEMP_SUFFIX);
}

Expected<std::string> readTextFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open " + path.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read " + path.string()};
    }
    return buffer.str();
}

Expected<void> writeFileAtomic(const fs::path& path, const std::string& content) {
    fs::path tmp = tempPathFor(path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "Failed to open " + tmp.string() + " for writing"};
        }
        out << content;
        out.flush();
        if (!out || !out.good()) {
            out.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return Error{ErrorCode::IoError, "Failed to write " + tmp.string()};
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Error{ErrorCode::IoError, "Failed to rename " + tmp.string() + ": " + ec.message()};
    }
    return {};
}

}
