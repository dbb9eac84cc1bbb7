#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include "test_utils.hpp"
#include "server/StaticServer.hpp"

namespace fs = std::filesystem;
namespace http = boost::beast::http;

using namespace folio;
using namespace folio::test::utils;

class StaticServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        site = tempDir / "public";
        std::string longPage = "<html><body>";
        for (int i = 0; i < 300; ++i) longPage += "<p>line " + std::to_string(i) + "</p>";
        longPage += "</body></html>";
        createFiles(site, {
            {"index.html", "<html>home</html>"},
            {"about.html", "<html>about</html>"},
            {"posts/index.html", "<html>posts</html>"},
            {"posts/long.html", longPage},
            {"img/logo.png", "\x89PNG"},
        });
        createFile(tempDir, "secret.txt", "do not serve");
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    HttpResponse get(const std::string& target, const std::string& acceptEncoding = "",
                     http::verb method = http::verb::get) {
        StaticServer server(site, "127.0.0.1", 0);
        HttpRequest req{method, target, 11};
        if (!acceptEncoding.empty()) req.set(http::field::accept_encoding, acceptEncoding);
        return server.respond(req);
    }

    fs::path tempDir;
    fs::path site;
};

// Test: Root serves index.html
TEST_F(StaticServerTest, RootServesIndex) {
    auto res = get("/");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "<html>home</html>");
    EXPECT_EQ(std::string(res[http::field::content_type]), "text/html; charset=utf-8");
}

// Test: Directories and extensionless paths
TEST_F(StaticServerTest, DirectoryAndPrettyUrls) {
    EXPECT_EQ(get("/posts/").body(), "<html>posts</html>");
    EXPECT_EQ(get("/posts").body(), "<html>posts</html>");
    EXPECT_EQ(get("/about").body(), "<html>about</html>");
    EXPECT_EQ(get("/about.html?ref=feed#top").body(), "<html>about</html>");
}

// Test: Binary types get their MIME type
TEST_F(StaticServerTest, ImageContentType) {
    auto res = get("/img/logo.png");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(std::string(res[http::field::content_type]), "image/png");
}

// Test: Missing files are 404
TEST_F(StaticServerTest, NotFound) {
    EXPECT_EQ(get("/nope.html").result(), http::status::not_found);
    EXPECT_EQ(get("/posts/nope").result(), http::status::not_found);
}

// Test: Paths leaving the root are refused
TEST_F(StaticServerTest, TraversalForbidden) {
    EXPECT_EQ(get("/../secret.txt").result(), http::status::forbidden);
    EXPECT_EQ(get("/posts/%2e%2e/%2e%2e/secret.txt").result(), http::status::forbidden);
}

// Test: Symlink pointing outside the root is refused
TEST_F(StaticServerTest, SymlinkEscapeForbidden) {
    fs::create_symlink(tempDir / "secret.txt", site / "leak.txt");
    EXPECT_EQ(get("/leak.txt").result(), http::status::forbidden);
}

// Test: Malformed targets are 400
TEST_F(StaticServerTest, BadRequest) {
    EXPECT_EQ(get("/bad%zz").result(), http::status::bad_request);
    EXPECT_EQ(get("/trunc%2").result(), http::status::bad_request);
}

// Test: Only GET and HEAD are allowed
TEST_F(StaticServerTest, MethodNotAllowed) {
    auto res = get("/", "", http::verb::post);
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(std::string(res[http::field::allow]), "GET, HEAD");
}

// Test: HEAD reports the length without a body
TEST_F(StaticServerTest, HeadHasNoBody) {
    auto res = get("/about.html", "", http::verb::head);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_TRUE(res.body().empty());
    EXPECT_EQ(std::string(res[http::field::content_length]), std::to_string(std::string("<html>about</html>").size()));
}

// Test: Large text responses are gzip-encoded when accepted
TEST_F(StaticServerTest, GzipWhenAccepted) {
    auto plain = get("/posts/long.html");
    EXPECT_EQ(std::string(plain[http::field::content_encoding]), "");

    auto gz = get("/posts/long.html", "gzip, deflate");
    EXPECT_EQ(std::string(gz[http::field::content_encoding]), "gzip");
    EXPECT_LT(gz.body().size(), plain.body().size());
    EXPECT_EQ(static_cast<unsigned char>(gz.body()[0]), 0x1f);

    // Small bodies are sent as-is
    auto small = get("/about.html", "gzip");
    EXPECT_EQ(std::string(small[http::field::content_encoding]), "");
    EXPECT_EQ(small.body(), "<html>about</html>");
}

// Test: MIME lookup is case-insensitive with a binary default
TEST(MimeTypeTest, Lookup) {
    EXPECT_EQ(mimeTypeFor(".CSS"), "text/css; charset=utf-8");
    EXPECT_EQ(mimeTypeFor(".svg"), "image/svg+xml");
    EXPECT_EQ(mimeTypeFor(".unknown"), "application/octet-stream");
    EXPECT_EQ(mimeTypeFor(""), "application/octet-stream");
}

// Test: Serving a missing directory fails before binding
TEST(StaticServerRunTest, MissingRootIsConfigError) {
    StaticServer server("/nonexistent/folio/public", "127.0.0.1", 0);
    auto res = server.run();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ConfigError);
}

// Test: Serves over TCP and returns success once interrupted
TEST_F(StaticServerTest, RunServesUntilInterrupted) {
    namespace asio = boost::asio;
    namespace beast = boost::beast;

    StaticServer server(site, "127.0.0.1", 0);
    Expected<void> result = Error{ErrorCode::InternalError, "server did not return"};
    std::thread runner([&] { result = server.run(); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (server.boundPort() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    uint16_t port = server.boundPort();

    // No ASSERTs until the server thread is joined
    beast::error_code ec;
    HttpResponse res;
    if (port != 0) {
        asio::io_context ioc;
        beast::tcp_stream stream(ioc);
        stream.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
        HttpRequest req{http::verb::get, "/about", 11};
        req.set(http::field::host, "127.0.0.1");
        if (!ec) http::write(stream, req, ec);
        beast::flat_buffer buffer;
        if (!ec) http::read(stream, buffer, res, ec);
        beast::error_code ignored;
        stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);

        std::raise(SIGINT);
    }
    runner.join();

    ASSERT_NE(port, 0) << result.error().message;
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "<html>about</html>");
    EXPECT_TRUE(result.has_value()) << result.error().message;
}
