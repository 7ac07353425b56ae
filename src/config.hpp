#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

// Process-wide settings, fixed at startup.
struct ServiceConfig {
    // listener
    std::string address = "127.0.0.1";
    unsigned short port = 5328;
    int concurrency = 4;
    bool use_ssl = false;
    std::string cert_file = "server.crt";
    std::string key_file = "server.key";
    bool verbose = true;
    // idle limit for a client to send its request or accept the response
    double read_timeout = 30.0;

    // input staging
    std::string base_origin = "http://localhost:3000";
    double fetch_timeout = 10.0;
    int max_redirects = 5;
    std::size_t max_input_bytes = 64 * 1024 * 1024;
    bool verify_fetch_tls = true;

    // execution
    std::string python_executable = "python3";
    double default_timeout = 10.0;
    double max_timeout = 60.0;
    std::size_t max_output_bytes = 1024 * 1024;
    std::filesystem::path work_root = std::filesystem::temp_directory_path();

    // durable artifacts
    std::filesystem::path store_root = "data/uploads";
    std::string artifact_url_prefix = "/api/uploads";

    std::size_t max_request_bytes = 16 * 1024 * 1024;
};

// Defaults with FRONTEND_BASE_URL, PYTHON_EXECUTABLE and UPLOADS_DIR applied.
ServiceConfig config_from_environment();

// Throws std::invalid_argument on an unknown flag or a malformed value.
// Sets show_help instead of exiting when --help is given.
ServiceConfig parse_args(int argc, char** argv, bool& show_help);

void print_help(const char* argv0);

// Throws std::invalid_argument when the settings are inconsistent.
void validate_config(const ServiceConfig& cfg);

// Absent or non-positive requests get the default, oversized ones the maximum.
double effective_timeout(std::optional<double> requested, const ServiceConfig& cfg);
