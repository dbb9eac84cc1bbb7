#pragma once

#include <string>

namespace folio {

/**
 * @brief Compress a buffer into a gzip member (RFC 1952) using zlib
 *
 * Used by the preview server for `Content-Encoding: gzip` responses.
 * Throws std::runtime_error if zlib reports a failure.
 */
std::string gzipCompress(const std::string& data);

/// True if an Accept-Encoding header value lists gzip with a non-zero q-value
bool acceptsGzip(const std::string& acceptEncoding);

}
