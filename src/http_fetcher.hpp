#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

// Transport failure, non-2xx status, redirect loop or oversized body.
class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IFetcher {
public:
    virtual ~IFetcher() = default;
    // Returns the response body verbatim. Throws FetchError.
    virtual std::string fetch(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

struct ParsedUrl {
    std::string scheme; // "http" or "https"
    std::string host;   // without IPv6 brackets
    std::string port;
    std::string target; // path + query, at least "/"

    bool is_tls() const { return scheme == "https"; }
    // scheme://host[:port] as written in a URL
    std::string origin() const;
};

std::optional<ParsedUrl> parse_url(const std::string& url);

// Resolves a Location header value against the URL that produced it.
std::string resolve_redirect(const ParsedUrl& current, const std::string& location);

// HTTP/HTTPS GET over Boost.Beast. One connection per request, no pooling.
class HttpFetcher : public IFetcher {
public:
    HttpFetcher(int max_redirects, std::size_t max_body_bytes, bool verify_tls);

    std::string fetch(const std::string& url, std::chrono::milliseconds timeout) override;

    struct Reply {
        unsigned status = 0;
        std::string reason;
        std::string location;
        std::string body;
    };

private:
    Reply get_once(const ParsedUrl& url, std::chrono::steady_clock::time_point deadline);

    int max_redirects_;
    std::size_t max_body_bytes_;
    bool verify_tls_;
};
