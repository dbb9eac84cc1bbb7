#include "util/Gzip.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <zlib.h>

namespace folio {

namespace {
    // 15 window bits plus 16 selects the gzip wrapper instead of zlib's
    constexpr int GZIP_WINDOW_BITS = 15 + 16;
    constexpr int DEFAULT_MEM_LEVEL = 8;

    std::string trimCopy(const std::string& s) {
        size_t a = 0, b = s.size();
        while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
        while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
        return s.substr(a, b - a);
    }
}

std::string gzipCompress(const std::string& data) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS,
                     DEFAULT_MEM_LEVEL, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("zlib deflateInit2 failed");
    }

    stream.avail_in = static_cast<uInt>(data.size());
    // Some zlib versions have non-const next_in, so we need to cast away const
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));

    // deflateBound does not account for the gzip header and trailer
    std::vector<uint8_t> compressed;
    compressed.resize(deflateBound(&stream, static_cast<uLong>(data.size())) + 18);

    stream.avail_out = static_cast<uInt>(compressed.size());
    stream.next_out = compressed.data();

    if (deflate(&stream, Z_FINISH) != Z_STREAM_END) {
        deflateEnd(&stream);
        throw std::runtime_error("zlib deflate failed");
    }

    compressed.resize(stream.total_out);
    deflateEnd(&stream);
    return std::string(reinterpret_cast<const char*>(compressed.data()), compressed.size());
}

bool acceptsGzip(const std::string& acceptEncoding) {
    std::istringstream iss(acceptEncoding);
    std::string item;
    while (std::getline(iss, item, ',')) {
        std::string coding = item;
        std::string params;
        auto semi = item.find(';');
        if (semi != std::string::npos) {
            coding = item.substr(0, semi);
            params = item.substr(semi + 1);
        }
        coding = trimCopy(coding);
        std::transform(coding.begin(), coding.end(), coding.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (coding != "gzip" && coding != "*") continue;

        params = trimCopy(params);
        if (params.rfind("q=", 0) == 0) {
            try {
                if (std::stod(params.substr(2)) <= 0.0) continue;
            } catch (const std::exception&) {
                continue;
            }
        }
        return true;
    }
    return false;
}

}
