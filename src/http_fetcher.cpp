#include "http_fetcher.hpp"
#include "run_step.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using Clock = std::chrono::steady_clock;

// --------------------- URL helpers ---------------------

std::string ParsedUrl::origin() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = (scheme == "http" && port == "80") || (scheme == "https" && port == "443");
    return scheme + "://" + h + (default_port ? "" : ":" + port);
}

std::optional<ParsedUrl> parse_url(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos) return std::nullopt;

    ParsedUrl u;
    u.scheme = url.substr(0, sep);
    std::transform(u.scheme.begin(), u.scheme.end(), u.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (u.scheme != "http" && u.scheme != "https") return std::nullopt;

    std::string rest = url.substr(sep + 3);
    auto hash = rest.find('#');
    if (hash != std::string::npos) rest.erase(hash);

    auto path_pos = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_pos);
    u.target = path_pos == std::string::npos ? "/" : rest.substr(path_pos);
    if (u.target[0] == '?') u.target = "/" + u.target;

    // credentials are never forwarded
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        u.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') return std::nullopt;
            u.port = tail.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            u.host = authority.substr(0, colon);
            u.port = authority.substr(colon + 1);
        } else {
            u.host = authority;
        }
    }

    if (u.host.empty()) return std::nullopt;
    if (u.port.empty()) u.port = u.is_tls() ? "443" : "80";
    if (!std::all_of(u.port.begin(), u.port.end(), [](unsigned char c) { return std::isdigit(c); }))
        return std::nullopt;
    return u;
}

std::string resolve_redirect(const ParsedUrl& current, const std::string& location) {
    if (location.find("://") != std::string::npos) return location;
    if (location.rfind("//", 0) == 0) return current.scheme + ":" + location;
    if (!location.empty() && location[0] == '/') return current.origin() + location;

    std::string path = current.target.substr(0, current.target.find('?'));
    return current.origin() + path.substr(0, path.rfind('/') + 1) + location;
}

static bool is_redirect(unsigned status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

// --------------------- transport ---------------------

static std::string describe(const beast::error_code& ec, const std::string& what) {
    if (ec == beast::error::timeout) return what + " timed out";
    return what + " failed: " + ec.message();
}

static std::string host_header(const ParsedUrl& u) {
    std::string origin = u.origin();
    return origin.substr(origin.find("://") + 3);
}

template <class Stream>
static HttpFetcher::Reply exchange(net::io_context& ioc, Stream& stream, const ParsedUrl& url,
                                   std::size_t body_limit) {
    http::request<http::empty_body> req{http::verb::get, url.target, 11};
    req.set(http::field::host, host_header(url));
    req.set(http::field::user_agent, "codebox-fetch/1.0");
    req.set(http::field::accept, "*/*");
    req.set(http::field::connection, "close");

    beast::error_code ec = run_step(ioc, [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });
    if (ec) throw FetchError(describe(ec, "sending request to " + url.host));

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(body_limit);
    ec = run_step(ioc, [&](auto handler) {
        http::async_read(stream, buffer, parser, std::move(handler));
    });
    if (ec == http::error::body_limit) {
        throw FetchError("response exceeds " + std::to_string(body_limit) + " bytes");
    }
    if (ec) throw FetchError(describe(ec, "reading response from " + url.host));

    auto res = parser.release();
    HttpFetcher::Reply r;
    r.status = res.result_int();
    r.reason = std::string(res.reason());
    r.location = std::string(res[http::field::location]);
    r.body = std::move(res.body());
    return r;
}

HttpFetcher::HttpFetcher(int max_redirects, std::size_t max_body_bytes, bool verify_tls)
    : max_redirects_(std::max(0, max_redirects)),
      max_body_bytes_(max_body_bytes),
      verify_tls_(verify_tls) {}

HttpFetcher::Reply HttpFetcher::get_once(const ParsedUrl& url, Clock::time_point deadline) {
    net::io_context ioc;

    // name resolution is not covered by the stream timer
    tcp::resolver resolver{ioc};
    beast::error_code ec = net::error::operation_aborted;
    bool resolved = false;
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(url.host, url.port,
        [&](beast::error_code e, tcp::resolver::results_type r) {
            ec = e;
            endpoints = std::move(r);
            resolved = true;
        });
    auto left = deadline - Clock::now();
    if (left > Clock::duration::zero()) ioc.run_for(left);
    if (!resolved) {
        resolver.cancel();
        ioc.restart();
        ioc.run();
        throw FetchError("resolving " + url.host + " timed out");
    }
    if (ec) throw FetchError(describe(ec, "resolving " + url.host));

    if (!url.is_tls()) {
        beast::tcp_stream stream{ioc};
        stream.expires_at(deadline);
        ec = run_step(ioc, [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });
        if (ec) throw FetchError(describe(ec, "connecting to " + host_header(url)));

        Reply r = exchange(ioc, stream, url, max_body_bytes_);

        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            std::cerr << "[fetch] shutdown error for " << url.host << ": " << ec.message() << std::endl;
        }
        return r;
    }

    ssl::context ctx{ssl::context::tls_client};
    if (verify_tls_) {
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);
    } else {
        ctx.set_verify_mode(ssl::verify_none);
    }

    ssl::stream<beast::tcp_stream> stream{ioc, ctx};
    if (verify_tls_) {
        stream.set_verify_callback(ssl::host_name_verification(url.host));
    }
    // Set SNI Hostname (many hosts need this to handshake successfully)
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        beast::error_code sni{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw FetchError(describe(sni, "setting SNI for " + url.host));
    }

    beast::get_lowest_layer(stream).expires_at(deadline);
    ec = run_step(ioc, [&](auto handler) {
        beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
    });
    if (ec) throw FetchError(describe(ec, "connecting to " + host_header(url)));

    ec = run_step(ioc, [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, std::move(handler));
    });
    if (ec) throw FetchError(describe(ec, "TLS handshake with " + url.host));

    Reply r = exchange(ioc, stream, url, max_body_bytes_);

    ec = run_step(ioc, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated && ec != beast::error::timeout) {
        std::cerr << "[fetch] TLS shutdown error for " << url.host << ": " << ec.message() << std::endl;
    }
    return r;
}

std::string HttpFetcher::fetch(const std::string& url, std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    std::string current = url;

    for (int hop = 0;; ++hop) {
        auto parsed = parse_url(current);
        if (!parsed) throw FetchError("invalid URL: " + current);

        Reply r = get_once(*parsed, deadline);

        if (is_redirect(r.status) && !r.location.empty()) {
            if (hop >= max_redirects_) {
                throw FetchError("exceeded " + std::to_string(max_redirects_) + " redirects for url: " + url);
            }
            current = resolve_redirect(*parsed, r.location);
            std::cout << "[fetch] " << r.status << " redirect to " << current << std::endl;
            continue;
        }
        if (r.status < 200 || r.status >= 300) {
            throw FetchError(std::to_string(r.status) + " " + r.reason + " for url: " + current);
        }
        return std::move(r.body);
    }
}
