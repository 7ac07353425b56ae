#pragma once
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "config.hpp"

class ArtifactStore;
class ExecutionService;
class ThreadPool;

// Beast server. The acceptor runs on its own thread and hands every
// connection to the worker pool; a connection carries one request (HTTP or a
// single WebSocket message) and is then closed. Socket I/O on a worker is
// bounded by the read timeout, execution itself by the execution timeout.
//
//   POST /api/python/execute           run a snippet
//   GET  <artifact prefix>/<sid>/<f>   fetch a promoted artifact
//   GET  /                             status
//   WS   /ws/execute                   one execute message per connection
class SandboxServer {
public:
    using json = nlohmann::json;
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    SandboxServer(const ServiceConfig& cfg, const ExecutionService& service, const ArtifactStore& store);
    ~SandboxServer();

    // Returns once the listener is up (true) or failed to come up (false).
    bool start();
    void stop();

    // Actual port, useful when configured with port 0.
    unsigned short port() const { return bound_port_.load(); }

    Response handle_request(const Request& req) const;

    // Execute payload -> response body. `status` is 400 for invalid requests.
    json process_request(const json& req, boost::beast::http::status& status) const;

private:
    // Accepted socket with the context its operations run on. One per
    // connection, so a worker can drive it without touching the acceptor.
    struct Connection {
        boost::asio::io_context ioc{1};
        boost::asio::ip::tcp::socket socket{ioc};
    };

    void run(std::promise<bool> ready);
    void handle_connection(Connection& conn);
    template <class Stream>
    void serve_connection(boost::asio::io_context& ioc, Stream& stream);
    std::chrono::milliseconds read_timeout() const;

    Response serve_artifact(const Request& req, const std::string& path) const;
    json status_document() const;

    const ServiceConfig& cfg_;
    const ExecutionService& service_;
    const ArtifactStore& store_;

    // the TLS context is shared with the workers, so it outlives the pool
    // (members are destroyed in reverse order)
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;

    std::atomic<bool> running{false};
    std::atomic<unsigned short> bound_port_{0};
    std::thread th;
    std::unique_ptr<ThreadPool> thread_pool;
};
