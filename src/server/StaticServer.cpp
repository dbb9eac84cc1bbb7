#include "server/StaticServer.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <memory>
#include <unordered_map>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/core.hpp>

#include "core/Constants.hpp"
#include "util/FileIO.hpp"
#include "util/Gzip.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace folio {

namespace {

constexpr auto SESSION_TIMEOUT = std::chrono::seconds(30);
constexpr const char* SERVER_NAME = "folio";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Expected<std::string> percentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) {
            return Error{ErrorCode::InvalidArgs, "truncated escape in " + in};
        }
        int hi = hexValue(in[i + 1]);
        int lo = hexValue(in[i + 2]);
        if (hi < 0 || lo < 0) return Error{ErrorCode::InvalidArgs, "bad escape in " + in};
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

bool isTextType(const std::string& mime) {
    return mime.rfind("text/", 0) == 0 || mime.rfind("application/javascript", 0) == 0 ||
           mime.rfind("application/json", 0) == 0 || mime.rfind("application/xml", 0) == 0 ||
           mime.rfind("image/svg+xml", 0) == 0;
}

HttpResponse makeError(const HttpRequest& req, http::status status, const std::string& text) {
    HttpResponse res{status, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(false);
    res.body() = text + "\n";
    res.prepare_payload();
    return res;
}

/// One connection: read a request, write the response, close
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, const StaticServer& server)
        : stream(std::move(socket)), server(server) {}

    void start() {
        stream.expires_after(SESSION_TIMEOUT);
        http::async_read(stream, buffer, request,
                         [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onRead(ec); });
    }

private:
    void onRead(beast::error_code ec) {
        if (ec) {
            if (ec != http::error::end_of_stream) Logger::instance().debug("read failed: " + ec.message());
            return;
        }
        response = server.respond(request);
        Logger::instance().info(std::string(request.method_string()) + " " + std::string(request.target()) +
                                " " + std::to_string(response.result_int()));
        http::async_write(stream, response,
                          [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onWrite(ec); });
    }

    void onWrite(beast::error_code ec) {
        if (ec) Logger::instance().debug("write failed: " + ec.message());
        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
    }

    beast::tcp_stream stream;
    beast::flat_buffer buffer;
    HttpRequest request;
    HttpResponse response;
    const StaticServer& server;
};

void acceptLoop(tcp::acceptor& acceptor, const StaticServer& server) {
    acceptor.async_accept([&acceptor, &server](beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) return;
        if (ec) {
            Logger::instance().warn("accept failed: " + ec.message());
        } else {
            std::make_shared<Session>(std::move(socket), server)->start();
        }
        acceptLoop(acceptor, server);
    });
}

}

std::string mimeTypeFor(const std::string& extension) {
    static const std::unordered_map<std::string, std::string> types = {
        {".html", "text/html; charset=utf-8"},
        {".htm", "text/html; charset=utf-8"},
        {".css", "text/css; charset=utf-8"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".svg", "image/svg+xml"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".ico", "image/x-icon"},
        {".txt", "text/plain; charset=utf-8"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".woff", "font/woff"},
        {".woff2", "font/woff2"},
    };
    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it == types.end() ? "application/octet-stream" : it->second;
}

Expected<fs::path> resolveRequestPath(const fs::path& root, const std::string& target) {
    std::string rawPath = target.substr(0, target.find_first_of("?#"));
    if (rawPath.empty() || rawPath.front() != '/') {
        return Error{ErrorCode::InvalidArgs, "request target must start with '/'"};
    }
    auto decoded = percentDecode(rawPath);
    if (!decoded) return decoded.error();
    const std::string& path = decoded.value();
    if (path.find('\0') != std::string::npos || path.find('\\') != std::string::npos) {
        return Error{ErrorCode::InvalidArgs, "illegal character in request path"};
    }

    fs::path rel;
    size_t pos = 1;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        std::string segment = path.substr(pos, next - pos);
        if (segment == "..") return Error{ErrorCode::Forbidden, "path escapes the site root"};
        if (!segment.empty() && segment != ".") rel /= segment;
        pos = next + 1;
    }

    std::error_code ec;
    fs::path base = fs::weakly_canonical(fs::absolute(root), ec);
    if (ec) base = fs::absolute(root).lexically_normal();
    fs::path candidate = base / rel;

    if (rel.empty() || fs::is_directory(candidate, ec)) {
        candidate /= "index.html";
    } else if (!fs::exists(candidate, ec) && !candidate.has_extension()) {
        candidate += ".html";
    }
    if (!fs::is_regular_file(candidate, ec)) {
        return Error{ErrorCode::NotFound, "no such file: " + path};
    }

    // Symlinks inside the output tree must not lead outside it
    fs::path real = fs::weakly_canonical(candidate, ec);
    if (ec) return Error{ErrorCode::NotFound, "no such file: " + path};
    fs::path within = real.lexically_relative(base);
    if (within.empty() || *within.begin() == "..") {
        return Error{ErrorCode::Forbidden, "path escapes the site root"};
    }
    return real;
}

StaticServer::StaticServer(fs::path root, std::string host, uint16_t port)
    : root(std::move(root)), host(std::move(host)), port(port) {}

HttpResponse StaticServer::respond(const HttpRequest& req) const {
    if (req.method() != http::verb::get && req.method() != http::verb::head) {
        HttpResponse res = makeError(req, http::status::method_not_allowed, "method not allowed");
        res.set(http::field::allow, "GET, HEAD");
        return res;
    }

    auto file = resolveRequestPath(root, std::string(req.target()));
    if (!file) {
        switch (file.error().code) {
            case ErrorCode::Forbidden: return makeError(req, http::status::forbidden, "forbidden");
            case ErrorCode::NotFound: return makeError(req, http::status::not_found, "not found");
            default: return makeError(req, http::status::bad_request, file.error().message);
        }
    }

    auto body = readTextFile(file.value());
    if (!body) {
        Logger::instance().warn(body.error().message);
        return makeError(req, http::status::internal_server_error, "cannot read file");
    }

    std::string mime = mimeTypeFor(file.value().extension().string());
    HttpResponse res{http::status::ok, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, mime);
    res.keep_alive(false);

    std::string payload = std::move(body.value());
    if (isTextType(mime)) {
        res.set(http::field::vary, "Accept-Encoding");
        auto acceptHeader = req.find(http::field::accept_encoding);
        bool gzipOk = acceptHeader != req.end() && acceptsGzip(std::string(acceptHeader->value()));
        if (gzipOk && payload.size() >= Constants::MIN_GZIP_BYTES) {
            try {
                payload = gzipCompress(payload);
                res.set(http::field::content_encoding, "gzip");
            } catch (const std::exception& e) {
                Logger::instance().warn(std::string("gzip failed, sending identity: ") + e.what());
            }
        }
    }

    res.content_length(payload.size());
    if (req.method() == http::verb::get) res.body() = std::move(payload);
    return res;
}

Expected<void> StaticServer::run() {
    std::error_code fsEc;
    if (!fs::is_directory(root, fsEc)) {
        return Error{ErrorCode::ConfigError, "output directory does not exist: " + root.string() +
                                                 " (run 'folio build' first)"};
    }

    try {
        asio::io_context ioc{1};
        beast::error_code ec;
        auto address = asio::ip::make_address(host, ec);
        if (ec) return Error{ErrorCode::ConfigError, "invalid host address '" + host + "'"};

        tcp::endpoint endpoint{address, port};
        tcp::acceptor acceptor{ioc};
        acceptor.open(endpoint.protocol(), ec);
        if (!ec) acceptor.set_option(asio::socket_base::reuse_address(true), ec);
        if (!ec) acceptor.bind(endpoint, ec);
        if (!ec) acceptor.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "cannot listen on " + host + ":" + std::to_string(port) + ": " + ec.message()};
        }

        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc, &acceptor](const beast::error_code& sigEc, int signo) {
            if (sigEc) return;
            Logger::instance().info("received signal " + std::to_string(signo) + ", stopping server");
            beast::error_code ignored;
            acceptor.close(ignored);
            ioc.stop();
        });

        acceptLoop(acceptor, *this);
        listeningPort = acceptor.local_endpoint().port();
        Logger::instance().info("serving " + root.string() + " at http://" + host + ":" +
                                std::to_string(listeningPort.load()) + "/ (Ctrl+C to stop)");
        ioc.run();
        listeningPort = 0;
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("server failed: ") + e.what()};
    }
    return {};
}

}
