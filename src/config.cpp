#include "config.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

static std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    if (v && *v) return v;
    return fallback;
}

static double to_seconds(const std::string& flag, const std::string& s) {
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used != s.size() || !std::isfinite(v)) throw std::invalid_argument(s);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number of seconds, got '" + s + "'");
    }
}

static long to_integer(const std::string& flag, const std::string& s) {
    try {
        size_t used = 0;
        long v = std::stol(s, &used);
        if (used != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + s + "'");
    }
}

ServiceConfig config_from_environment() {
    ServiceConfig cfg;

    const char* origin = std::getenv("FRONTEND_BASE_URL");
    if (origin && *origin) {
        cfg.base_origin = origin;
        std::cout << "[config] Using FRONTEND_BASE_URL from environment: " << cfg.base_origin << std::endl;
    } else {
        std::cerr << "[config] FRONTEND_BASE_URL not set, using default: " << cfg.base_origin << std::endl;
    }

    cfg.python_executable = env_or("PYTHON_EXECUTABLE", cfg.python_executable);
    cfg.store_root = env_or("UPLOADS_DIR", cfg.store_root.string());
    return cfg;
}

void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "\n"
              << "  --address A            listen address (default 127.0.0.1)\n"
              << "  --port N               listen port (default 5328)\n"
              << "  --concurrency N        worker threads (default 4)\n"
              << "  --ssl                  serve HTTPS/WSS using --cert and --key\n"
              << "  --cert FILE            certificate chain (default server.crt)\n"
              << "  --key FILE             private key (default server.key)\n"
              << "  --read-timeout S       how long a client may take to send a request\n"
              << "  --base-origin URL      origin for path-absolute input URLs\n"
              << "  --python PATH          interpreter to run snippets with\n"
              << "  --default-timeout S    execution timeout when none is requested\n"
              << "  --max-timeout S        ceiling for requested timeouts\n"
              << "  --fetch-timeout S      per-input download timeout\n"
              << "  --max-redirects N      redirects followed per input download\n"
              << "  --max-output-bytes N   stdout/stderr capture limit per stream\n"
              << "  --work-root DIR        parent of per-request work areas\n"
              << "  --store-root DIR       durable artifact store\n"
              << "  --artifact-prefix P    URL prefix of promoted artifacts\n"
              << "  --insecure-fetch       do not verify TLS peers of input downloads\n"
              << "  --quiet                only log failures\n"
              << "\nFRONTEND_BASE_URL, PYTHON_EXECUTABLE and UPLOADS_DIR provide defaults.\n"
              << "The server can be stopped gracefully with Ctrl+C (SIGINT) or SIGTERM.\n";
}

ServiceConfig parse_args(int argc, char** argv, bool& show_help) {
    ServiceConfig a = config_from_environment();
    show_help = false;

    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(s + " requires a value");
            return argv[++i];
        };

        if (s == "--help" || s == "-h") { show_help = true; return a; }
        else if (s == "--address") { a.address = next(); }
        else if (s == "--port") {
            long p = to_integer(s, next());
            if (p <= 0 || p > 65535) throw std::invalid_argument("--port out of range");
            a.port = static_cast<unsigned short>(p);
        }
        else if (s == "--concurrency") { a.concurrency = static_cast<int>(to_integer(s, next())); }
        else if (s == "--ssl") { a.use_ssl = true; }
        else if (s == "--cert") { a.cert_file = next(); }
        else if (s == "--key") { a.key_file = next(); }
        else if (s == "--read-timeout") { a.read_timeout = to_seconds(s, next()); }
        else if (s == "--base-origin") { a.base_origin = next(); }
        else if (s == "--python") { a.python_executable = next(); }
        else if (s == "--default-timeout") { a.default_timeout = to_seconds(s, next()); }
        else if (s == "--max-timeout") { a.max_timeout = to_seconds(s, next()); }
        else if (s == "--fetch-timeout") { a.fetch_timeout = to_seconds(s, next()); }
        else if (s == "--max-redirects") { a.max_redirects = static_cast<int>(to_integer(s, next())); }
        else if (s == "--max-output-bytes") {
            long n = to_integer(s, next());
            if (n <= 0) throw std::invalid_argument("--max-output-bytes must be positive");
            a.max_output_bytes = static_cast<size_t>(n);
        }
        else if (s == "--work-root") { a.work_root = next(); }
        else if (s == "--store-root") { a.store_root = next(); }
        else if (s == "--artifact-prefix") { a.artifact_url_prefix = next(); }
        else if (s == "--insecure-fetch") { a.verify_fetch_tls = false; }
        else if (s == "--quiet") { a.verbose = false; }
        else {
            throw std::invalid_argument("Unknown arg: " + s);
        }
    }
    return a;
}

void validate_config(const ServiceConfig& cfg) {
    if (cfg.concurrency < 1)
        throw std::invalid_argument("concurrency must be at least 1");
    if (!(cfg.default_timeout > 0))
        throw std::invalid_argument("default timeout must be positive");
    if (cfg.max_timeout < cfg.default_timeout)
        throw std::invalid_argument("max timeout must not be below the default timeout");
    if (!(cfg.read_timeout > 0))
        throw std::invalid_argument("read timeout must be positive");
    if (!(cfg.fetch_timeout > 0))
        throw std::invalid_argument("fetch timeout must be positive");
    if (cfg.max_redirects < 0)
        throw std::invalid_argument("max redirects must not be negative");
    if (cfg.python_executable.empty())
        throw std::invalid_argument("python executable must not be empty");
    if (cfg.base_origin.rfind("http://", 0) != 0 && cfg.base_origin.rfind("https://", 0) != 0)
        throw std::invalid_argument("base origin must be an http:// or https:// URL");
}

double effective_timeout(std::optional<double> requested, const ServiceConfig& cfg) {
    if (!requested || !std::isfinite(*requested) || *requested <= 0) {
        return cfg.default_timeout;
    }
    if (*requested > cfg.max_timeout) {
        return cfg.max_timeout;
    }
    return *requested;
}
