#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct InputFileSpec {
    std::string filename;   // destination inside the work area
    std::string source_url; // absolute URL, or path-absolute against the base origin
};

struct ExecutionRequest {
    std::string code;
    std::string session_id;
    std::vector<InputFileSpec> input_files;
    std::optional<double> timeout_seconds;
};

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<std::string> error_message;
    bool success = false;
    std::optional<std::string> artifact_reference;
};

// Malformed inbound request; reported to the caller as a client error
// before any work area is opened.
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
