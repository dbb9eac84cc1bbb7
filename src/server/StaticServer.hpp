#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

#include <boost/beast/http.hpp>

#include "util/Expected.hpp"

namespace folio {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * @brief Map a request target onto a file below root
 *
 * Query and fragment are dropped and percent-escapes decoded. `/` and
 * directories map to their `index.html`; an extensionless path that does
 * not exist falls back to `<path>.html`.
 *
 * @return Absolute file path, InvalidArgs for a malformed target, Forbidden
 *         when the path would leave root, NotFound when nothing matches
 */
Expected<std::filesystem::path> resolveRequestPath(const std::filesystem::path& root, const std::string& target);

/// Content-Type for a file extension (".html" -> "text/html; charset=utf-8")
std::string mimeTypeFor(const std::string& extension);

/**
 * @brief Loopback HTTP server for previewing the build output
 *
 * Single-threaded Boost.Beast server: GET and HEAD only, one request per
 * connection, text responses gzip-encoded when the client accepts it.
 * run() blocks until SIGINT or SIGTERM arrives.
 */
class StaticServer {
public:
    StaticServer(std::filesystem::path root, std::string host, uint16_t port);

    /// Serve until interrupted; error if the address cannot be bound
    Expected<void> run();

    /// Build the response for one request (no I/O besides reading the file)
    HttpResponse respond(const HttpRequest& req) const;

    /// Port actually bound by run() (useful with port 0); 0 until listening
    uint16_t boundPort() const { return listeningPort.load(); }

private:
    std::filesystem::path root;
    std::string host;
    uint16_t port;
    std::atomic<uint16_t> listeningPort{0};
};

}
