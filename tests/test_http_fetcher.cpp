#include <gtest/gtest.h>
#include "http_fetcher.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <thread>

namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

// Minimal origin server answering one request per connection.
class LocalOrigin {
public:
    LocalOrigin() : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        th_ = std::thread([this] { loop(); });
    }
    ~LocalOrigin() {
        stopping_ = true;
        boost::system::error_code ec;
        net::io_context wake;
        tcp::socket s{wake};
        s.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
        th_.join();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    void loop() {
        while (!stopping_) {
            tcp::socket socket{ioc_};
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stopping_) continue;
            serve(socket);
        }
    }

    void serve(tcp::socket& socket) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        boost::system::error_code ec;
        http::read(socket, buffer, req, ec);
        if (ec) return;

        std::string target(req.target());
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.keep_alive(false);
        if (target == "/ok") {
            res.body() = "payload";
        } else if (target == "/binary") {
            res.body() = std::string("\0\x01\x02\xff", 4);
        } else if (target == "/redirect") {
            res.result(http::status::found);
            res.set(http::field::location, "/ok");
        } else if (target == "/relative/redirect") {
            res.result(http::status::moved_permanently);
            res.set(http::field::location, "target");
        } else if (target == "/relative/target") {
            res.body() = "payload";
        } else if (target == "/loop") {
            res.result(http::status::temporary_redirect);
            res.set(http::field::location, "/loop");
        } else if (target == "/big") {
            res.body() = std::string(4096, 'x');
        } else if (target == "/slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            res.body() = "late";
        } else {
            res.result(http::status::not_found);
            res.body() = "nope";
        }
        res.prepare_payload();
        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread th_;
};

constexpr std::chrono::milliseconds kTimeout{5000};

} // namespace

TEST(ParseUrl, SplitsComponents) {
    auto u = parse_url("https://user:pw@Example.com:8443/a/b?q=1#frag");
    ASSERT_TRUE(u);
    EXPECT_EQ(u->scheme, "https");
    EXPECT_EQ(u->host, "Example.com");
    EXPECT_EQ(u->port, "8443");
    EXPECT_EQ(u->target, "/a/b?q=1");
    EXPECT_EQ(u->origin(), "https://Example.com:8443");
}

TEST(ParseUrl, DefaultsAndIpv6) {
    auto u = parse_url("http://localhost");
    ASSERT_TRUE(u);
    EXPECT_EQ(u->port, "80");
    EXPECT_EQ(u->target, "/");
    EXPECT_EQ(u->origin(), "http://localhost");

    auto v6 = parse_url("http://[::1]:3000?x=1");
    ASSERT_TRUE(v6);
    EXPECT_EQ(v6->host, "::1");
    EXPECT_EQ(v6->target, "/?x=1");
    EXPECT_EQ(v6->origin(), "http://[::1]:3000");
}

TEST(ParseUrl, RejectsUnsupported) {
    EXPECT_FALSE(parse_url("ftp://host/file"));
    EXPECT_FALSE(parse_url("/relative/path"));
    EXPECT_FALSE(parse_url("http:///nohost"));
    EXPECT_FALSE(parse_url("http://host:port/"));
}

TEST(ResolveRedirect, HandlesLocationForms) {
    auto cur = *parse_url("http://h:8080/dir/file?x=1");
    EXPECT_EQ(resolve_redirect(cur, "https://other/x"), "https://other/x");
    EXPECT_EQ(resolve_redirect(cur, "//cdn/x"), "http://cdn/x");
    EXPECT_EQ(resolve_redirect(cur, "/root"), "http://h:8080/root");
    EXPECT_EQ(resolve_redirect(cur, "sibling"), "http://h:8080/dir/sibling");
}

TEST(HttpFetcher, FetchesBody) {
    LocalOrigin origin;
    HttpFetcher fetcher(5, 1024, true);
    EXPECT_EQ(fetcher.fetch(origin.url("/ok"), kTimeout), "payload");
    EXPECT_EQ(fetcher.fetch(origin.url("/binary"), kTimeout), std::string("\0\x01\x02\xff", 4));
}

TEST(HttpFetcher, FollowsRedirects) {
    LocalOrigin origin;
    HttpFetcher fetcher(5, 1024, true);
    EXPECT_EQ(fetcher.fetch(origin.url("/redirect"), kTimeout), "payload");
    EXPECT_EQ(fetcher.fetch(origin.url("/relative/redirect"), kTimeout), "payload");
}

TEST(HttpFetcher, StopsRedirectLoops) {
    LocalOrigin origin;
    HttpFetcher fetcher(3, 1024, true);
    try {
        fetcher.fetch(origin.url("/loop"), kTimeout);
        FAIL() << "expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_NE(std::string(e.what()).find("exceeded 3 redirects"), std::string::npos);
    }
}

TEST(HttpFetcher, NonSuccessStatusIsError) {
    LocalOrigin origin;
    HttpFetcher fetcher(5, 1024, true);
    try {
        fetcher.fetch(origin.url("/missing"), kTimeout);
        FAIL() << "expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(std::string(e.what()), "404 Not Found for url: " + origin.url("/missing"));
    }
}

TEST(HttpFetcher, EnforcesBodyLimit) {
    LocalOrigin origin;
    HttpFetcher fetcher(5, 1024, true);
    try {
        fetcher.fetch(origin.url("/big"), kTimeout);
        FAIL() << "expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(std::string(e.what()), "response exceeds 1024 bytes");
    }
}

TEST(HttpFetcher, TimesOut) {
    LocalOrigin origin;
    HttpFetcher fetcher(5, 1024, true);
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW(fetcher.fetch(origin.url("/slow"), std::chrono::milliseconds(300)), FetchError);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(1400));
}

TEST(HttpFetcher, UnreachableHost) {
    unsigned short closed_port;
    {
        net::io_context ioc;
        tcp::acceptor scratch(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        closed_port = scratch.local_endpoint().port();
    }
    HttpFetcher fetcher(5, 1024, true);
    EXPECT_THROW(fetcher.fetch("http://127.0.0.1:" + std::to_string(closed_port) + "/x", kTimeout), FetchError);
    EXPECT_THROW(fetcher.fetch("not a url", kTimeout), FetchError);
}
