#include "core/FrontMatter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "core/Constants.hpp"

namespace folio {

namespace {

std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::string unquote(const std::string& v) {
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

bool isClosingMarker(const std::string& line) {
    return line == Constants::FRONT_MATTER_MARKER || line == "...";
}

}

FrontMatter FrontMatter::defaultsFor(const std::filesystem::path& contentPath) {
    FrontMatter fm;
    fm.title = contentPath.stem().string();
    return fm;
}

bool parseFlag(const std::string& value) {
    std::string v = trim(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "true" || v == "yes" || v == "on" || v == "1";
}

bool isIsoDate(const std::string& value) {
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') return false;
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return false;
    }
    int year = std::stoi(value.substr(0, 4));
    int month = std::stoi(value.substr(5, 2));
    int day = std::stoi(value.substr(8, 2));
    if (month < 1 || month > 12 || day < 1) return false;

    static const int daysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int limit = daysInMonth[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) limit = 29;
    return day <= limit;
}

Expected<FrontMatter> parseFrontMatter(const std::string& text, const FrontMatter& defaults) {
    FrontMatter fm = defaults;
    std::istringstream in(text);
    std::string line;

    if (!std::getline(in, line)) return fm;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    // Skip a UTF-8 byte order mark
    if (line.rfind("\xEF\xBB\xBF", 0) == 0) line.erase(0, 3);
    if (trim(line) != Constants::FRONT_MATTER_MARKER) return fm;

    fm.present = true;
    size_t lineNo = 1;
    bool closed = false;
    bool haveKey = false;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (isClosingMarker(trim(line)) && !line.empty() && !std::isspace(static_cast<unsigned char>(line[0]))) {
            closed = true;
            break;
        }

        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;

        // Indented lines and list items belong to the previous key (YAML lists, folded text)
        if (std::isspace(static_cast<unsigned char>(line[0])) || t.rfind("- ", 0) == 0 || t == "-") {
            if (!haveKey) {
                return Error{ErrorCode::MetadataError,
                             "front-matter line " + std::to_string(lineNo) + ": continuation without a key"};
            }
            continue;
        }

        auto colon = t.find(':');
        if (colon == std::string::npos) {
            return Error{ErrorCode::MetadataError,
                         "front-matter line " + std::to_string(lineNo) + ": expected 'key: value'"};
        }
        std::string key = trim(t.substr(0, colon));
        std::string value = unquote(trim(t.substr(colon + 1)));
        if (key.empty()) {
            return Error{ErrorCode::MetadataError,
                         "front-matter line " + std::to_string(lineNo) + ": empty key"};
        }
        haveKey = true;

        if (key == "title") fm.title = value;
        else if (key == "subtitle") fm.subtitle = value;
        else if (key == "date") fm.date = value;
        else if (key == "word_count") fm.wordCount = value;
        else if (key == "generate_toc") fm.generateToc = parseFlag(value);
        else fm.extra[key] = value;
    }

    if (!closed) {
        return Error{ErrorCode::MetadataError, "front-matter block is not closed"};
    }
    return fm;
}

}
