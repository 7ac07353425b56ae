// sandbox_server.cpp
#include "sandbox_server.hpp"
#include "artifact_store.hpp"
#include "execution_service.hpp"
#include "run_step.hpp"
#include "thread_pool.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>

using tcp = boost::asio::ip::tcp;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
namespace ssl = boost::asio::ssl;
using json = nlohmann::json;

static const char* kExecutePath = "/api/python/execute";
static const char* kWebSocketPath = "/ws/execute";

// Helper: treat these errors as normal client disconnects (not server fatal)
static bool is_normal_disconnect(const boost::system::error_code& ec) {
    if (!ec) return false;
    return ec == net::error::eof
        || ec == net::error::connection_reset
        || ec == net::error::connection_aborted
        || ec == http::error::end_of_stream
        || ec == websocket::error::closed
        || ec == ssl::error::stream_truncated;
}

static std::string dump(const json& j) {
    // child output is not guaranteed to be UTF-8
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static SandboxServer::Response json_response(http::status status, const json& body, unsigned version) {
    SandboxServer::Response res{status, version};
    res.set(http::field::server, "codebox");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = dump(body);
    res.prepare_payload();
    return res;
}

static SandboxServer::Response method_not_allowed(const char* allow, unsigned version) {
    auto res = json_response(http::status::method_not_allowed,
                             json{{"error", std::string("Method not allowed; use ") + allow + "."}}, version);
    res.set(http::field::allow, allow);
    return res;
}

SandboxServer::SandboxServer(const ServiceConfig& cfg, const ExecutionService& service, const ArtifactStore& store)
    : cfg_(cfg), service_(service), store_(store) {
    std::cout << "[server] Initializing with concurrency: " << cfg_.concurrency << std::endl;
    thread_pool = std::make_unique<ThreadPool>(static_cast<size_t>(cfg_.concurrency));
}

SandboxServer::~SandboxServer() { stop(); }

json SandboxServer::process_request(const json& req, http::status& status) const {
    status = http::status::ok;
    ExecutionRequest parsed;
    try {
        parsed = parse_execution_request(req);
    } catch (const ValidationError& e) {
        std::cerr << "[server] Rejected request: " << e.what() << std::endl;
        status = http::status::bad_request;
        return json{{"error", e.what()}};
    }
    return to_json(service_.execute(parsed));
}

json SandboxServer::status_document() const {
    return json{
        {"status", "online"},
        {"service", "codebox"},
        {"endpoints", {
            {"execute", kExecutePath},
            {"artifacts", store_.url_prefix() + "/<sessionId>/<filename>"},
            {"websocket", kWebSocketPath},
        }},
        {"config", {
            {"defaultTimeout", cfg_.default_timeout},
            {"maxTimeout", cfg_.max_timeout},
        }},
        {"workers", thread_pool->size()},
        {"activeRequests", thread_pool->active()},
        {"queuedRequests", thread_pool->pending()},
    };
}

SandboxServer::Response SandboxServer::serve_artifact(const Request& req, const std::string& rest) const {
    const unsigned v = req.version();
    const bool head = req.method() == http::verb::head;
    if (req.method() != http::verb::get && !head) return method_not_allowed("GET, HEAD", v);

    auto slash = rest.find('/');
    if (slash == std::string::npos || rest.find('/', slash + 1) != std::string::npos) {
        return json_response(http::status::bad_request, json{{"error", "Invalid file path"}}, v);
    }
    const std::string session = rest.substr(0, slash);
    const std::string filename = rest.substr(slash + 1);
    if (!ArtifactStore::is_safe_component(session) || !ArtifactStore::is_safe_component(filename)) {
        return json_response(http::status::bad_request, json{{"error", "Invalid path components"}}, v);
    }

    auto file = store_.locate(session, filename);
    if (!file) {
        return json_response(http::status::not_found, json{{"error", "File not found"}}, v);
    }

    std::string etag;
    try {
        etag = "\"" + sha256_file(*file) + "\"";
    } catch (const std::exception& e) {
        std::cerr << "[server] Cannot read artifact " << file->string() << ": " << e.what() << std::endl;
        return json_response(http::status::internal_server_error, json{{"error", "Error serving file"}}, v);
    }

    // artifacts are never rewritten, so the digest identifies the content
    if (req[http::field::if_none_match] == etag) {
        Response res{http::status::not_modified, v};
        res.set(http::field::server, "codebox");
        res.set(http::field::etag, etag);
        res.keep_alive(false);
        return res;
    }

    std::ifstream in(*file, std::ios::binary);
    if (!in) {
        std::cerr << "[server] Cannot open artifact " << file->string() << std::endl;
        return json_response(http::status::internal_server_error, json{{"error", "Error serving file"}}, v);
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    Response res{http::status::ok, v};
    res.set(http::field::server, "codebox");
    res.set(http::field::content_type, content_type_for(*file));
    res.set(http::field::cache_control, "public, max-age=31536000");
    res.set(http::field::etag, etag);
    res.keep_alive(false);
    if (head) {
        res.content_length(data.size());
    } else {
        res.body() = std::move(data);
        res.prepare_payload();
    }
    return res;
}

SandboxServer::Response SandboxServer::handle_request(const Request& req) const {
    const unsigned v = req.version();
    std::string target(req.target());
    const std::string path = target.substr(0, target.find('?'));

    if (cfg_.verbose) {
        std::cout << "[server] " << req.method_string() << " " << path << std::endl;
    }

    if (path == kExecutePath) {
        if (req.method() != http::verb::post) return method_not_allowed("POST", v);
        json body = json::parse(req.body(), nullptr, false);
        if (body.is_discarded()) {
            return json_response(http::status::bad_request, json{{"error", "Request body must be valid JSON."}}, v);
        }
        http::status status;
        json out = process_request(body, status);
        return json_response(status, out, v);
    }

    if (path == "/") {
        if (req.method() != http::verb::get) return method_not_allowed("GET", v);
        return json_response(http::status::ok, status_document(), v);
    }

    const std::string prefix = store_.url_prefix() + "/";
    if (path.compare(0, prefix.size(), prefix) == 0) {
        return serve_artifact(req, path.substr(prefix.size()));
    }

    return json_response(http::status::not_found, json{{"error", "Not found: " + path}}, v);
}

std::chrono::milliseconds SandboxServer::read_timeout() const {
    return std::chrono::milliseconds(static_cast<long long>(cfg_.read_timeout * 1000));
}

// Every socket operation is asynchronous under the stream's expiry and driven
// to completion by run_step; a silent or stalled client costs one worker at
// most read_timeout per step. Execution runs with the expiry disarmed.
template <class Stream>
void SandboxServer::serve_connection(net::io_context& ioc, Stream& stream) {
    auto& tcp_layer = beast::get_lowest_layer(stream);
    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(cfg_.max_request_bytes);

    tcp_layer.expires_after(read_timeout());
    beast::error_code ec = run_step(ioc, [&](auto handler) {
        http::async_read(stream, buffer, parser, std::move(handler));
    });
    if (ec == http::error::body_limit) {
        auto res = json_response(http::status::payload_too_large,
                                 json{{"error", "Request body exceeds " + std::to_string(cfg_.max_request_bytes) + " bytes."}}, 11);
        tcp_layer.expires_after(read_timeout());
        ec = run_step(ioc, [&](auto handler) { http::async_write(stream, res, std::move(handler)); });
        if (ec && !is_normal_disconnect(ec)) std::cerr << "[server] write error: " << ec.message() << std::endl;
        return;
    }
    if (ec == beast::error::timeout) {
        std::cerr << "[server] Closing idle connection after " << cfg_.read_timeout << "s" << std::endl;
        return;
    }
    if (ec) {
        if (!is_normal_disconnect(ec)) std::cerr << "[server] read error: " << ec.message() << std::endl;
        return;
    }
    Request req = parser.release();

    if (websocket::is_upgrade(req)) {
        std::string target(req.target());
        if (target.substr(0, target.find('?')) != kWebSocketPath) {
            auto res = json_response(http::status::not_found, json{{"error", "Not found: " + target}}, req.version());
            tcp_layer.expires_after(read_timeout());
            ec = run_step(ioc, [&](auto handler) { http::async_write(stream, res, std::move(handler)); });
            if (ec && !is_normal_disconnect(ec)) std::cerr << "[server] write error: " << ec.message() << std::endl;
            return;
        }

        // the websocket's own timers stay off; the tcp expiry bounds each step
        websocket::stream<Stream&> ws{stream};
        ws.read_message_max(cfg_.max_request_bytes);
        tcp_layer.expires_after(read_timeout());
        ec = run_step(ioc, [&](auto handler) { ws.async_accept(req, std::move(handler)); });
        if (ec) {
            std::cerr << "[server] WebSocket accept error: " << ec.message() << std::endl;
            return;
        }

        beast::flat_buffer msg;
        tcp_layer.expires_after(read_timeout());
        ec = run_step(ioc, [&](auto handler) { ws.async_read(msg, std::move(handler)); });
        if (ec) {
            if (!is_normal_disconnect(ec)) std::cerr << "[server] WebSocket read error: " << ec.message() << std::endl;
            return;
        }

        tcp_layer.expires_never();
        json out;
        json in = json::parse(beast::buffers_to_string(msg.data()), nullptr, false);
        if (in.is_discarded()) {
            out = json{{"error", "Message must be valid JSON."}};
        } else {
            http::status status;
            out = process_request(in, status);
        }

        const std::string text = dump(out);
        ws.text(true);
        tcp_layer.expires_after(read_timeout());
        ec = run_step(ioc, [&](auto handler) { ws.async_write(net::buffer(text), std::move(handler)); });
        if (ec) {
            if (!is_normal_disconnect(ec)) std::cerr << "[server] WebSocket write error: " << ec.message() << std::endl;
            return;
        }
        tcp_layer.expires_after(read_timeout());
        ec = run_step(ioc, [&](auto handler) { ws.async_close(websocket::close_code::normal, std::move(handler)); });
        if (ec && !is_normal_disconnect(ec)) {
            std::cerr << "[server] WebSocket close error: " << ec.message() << std::endl;
        }
        return;
    }

    tcp_layer.expires_never();
    Response res = handle_request(req);
    tcp_layer.expires_after(read_timeout());
    ec = run_step(ioc, [&](auto handler) { http::async_write(stream, res, std::move(handler)); });
    if (ec && !is_normal_disconnect(ec)) {
        std::cerr << "[server] write error: " << ec.message() << std::endl;
    }
}

void SandboxServer::handle_connection(Connection& conn) {
    beast::error_code ec;
    try {
        if (ssl_ctx_) {
            beast::ssl_stream<beast::tcp_stream> tls{std::move(conn.socket), *ssl_ctx_};
            beast::get_lowest_layer(tls).expires_after(read_timeout());
            ec = run_step(conn.ioc, [&](auto handler) {
                tls.async_handshake(ssl::stream_base::server, std::move(handler));
            });
            if (ec) {
                std::cerr << "[server] TLS handshake error: " << ec.message() << std::endl;
            } else {
                serve_connection(conn.ioc, tls);
                beast::get_lowest_layer(tls).expires_after(read_timeout());
                ec = run_step(conn.ioc, [&](auto handler) { tls.async_shutdown(std::move(handler)); });
                if (ec && !is_normal_disconnect(ec) && ec != beast::error::timeout) {
                    std::cerr << "[server] TLS shutdown error: " << ec.message() << std::endl;
                }
            }
            beast::get_lowest_layer(tls).close();
        } else {
            beast::tcp_stream stream{std::move(conn.socket)};
            serve_connection(conn.ioc, stream);
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
            stream.close();
        }
    } catch (const std::exception& e) {
        std::cerr << "[server] connection error: " << e.what() << std::endl;
    }
}

bool SandboxServer::start() {
    if (running) return false;
    running = true;
    std::promise<bool> ready;
    auto up = ready.get_future();
    th = std::thread(&SandboxServer::run, this, std::move(ready));
    if (!up.get()) {
        running = false;
        if (th.joinable()) th.join();
        return false;
    }
    return true;
}

void SandboxServer::stop() {
    bool was_running = running.exchange(false);
    if (was_running && bound_port_ != 0) {
        // unblock accept() with a throwaway connection
        std::string host = cfg_.address;
        if (host == "0.0.0.0") host = "127.0.0.1";
        else if (host == "::") host = "::1";
        boost::system::error_code ec;
        net::io_context wake;
        tcp::socket s{wake};
        auto addr = net::ip::make_address(host, ec);
        if (!ec) s.connect(tcp::endpoint{addr, bound_port_.load()}, ec);
        if (ec) std::cerr << "[server] could not wake acceptor: " << ec.message() << std::endl;
        s.close(ec);
    }
    if (th.joinable()) th.join();
    if (thread_pool) thread_pool->shutdown();
}

void SandboxServer::run(std::promise<bool> ready) {
    bool announced = false;
    try {
        if (cfg_.use_ssl) {
            ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tlsv12_server);
            ssl_ctx_->use_certificate_chain_file(cfg_.cert_file);
            ssl_ctx_->use_private_key_file(cfg_.key_file, ssl::context::pem);
        }

        boost::system::error_code ec;
        auto address = net::ip::make_address(cfg_.address, ec);
        if (ec) {
            std::cerr << "[server] invalid address " << cfg_.address << ": " << ec.message() << std::endl;
            ready.set_value(false);
            return;
        }
        tcp::endpoint endpoint{address, cfg_.port};
        tcp::acceptor acceptor{ioc_};
        acceptor.open(endpoint.protocol(), ec);
        if (ec) {
            std::cerr << "[server] acceptor.open error: " << ec.message() << std::endl;
            ready.set_value(false);
            return;
        }
        acceptor.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            std::cerr << "[server] set_option error: " << ec.message() << std::endl;
        }
        acceptor.bind(endpoint, ec);
        if (ec) {
            std::cerr << "[server] bind error: " << ec.message() << std::endl;
            ready.set_value(false);
            return;
        }
        acceptor.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            std::cerr << "[server] listen error: " << ec.message() << std::endl;
            ready.set_value(false);
            return;
        }

        bound_port_ = acceptor.local_endpoint().port();
        std::cout << "[server] Listening on " << (ssl_ctx_ ? "https://" : "http://")
                  << cfg_.address << ":" << bound_port_.load() << std::endl;
        std::cout << "[server] - execute endpoint: " << kExecutePath << std::endl;
        std::cout << "[server] - artifacts: " << store_.url_prefix() << "/<sessionId>/<filename>" << std::endl;
        std::cout << "[server] - websocket: " << kWebSocketPath << std::endl;
        announced = true;
        ready.set_value(true);

        while (running) {
            auto conn = std::make_shared<Connection>();
            acceptor.accept(conn->socket, ec);
            if (!running) break;
            if (ec) {
                std::cerr << "[server] accept error: " << ec.message() << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            try {
                thread_pool->enqueue([this, conn] { handle_connection(*conn); });
            } catch (const std::exception& e) {
                std::cerr << "[server] dropping connection: " << e.what() << std::endl;
            }
        }
        acceptor.close(ec);
    } catch (const std::exception& e) {
        std::cerr << "[server] fatal error: " << e.what() << std::endl;
        if (!announced) ready.set_value(false);
    }
}
