#include "execution_service.hpp"
#include "code_assembler.hpp"
#include "work_area.hpp"
#include <chrono>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

// --------------------- request parsing ---------------------

// The original client sent snake_case names; both spellings are accepted.
static const json* field(const json& body, const char* name, const char* alias) {
    auto it = body.find(name);
    if (it != body.end() && !it->is_null()) return &*it;
    if (!alias) return nullptr;
    it = body.find(alias);
    if (it != body.end() && !it->is_null()) return &*it;
    return nullptr;
}

ExecutionRequest parse_execution_request(const json& body) {
    if (!body.is_object()) {
        throw ValidationError("Request body must be a JSON object.");
    }

    ExecutionRequest req;

    const json* code = field(body, "code", nullptr);
    if (!code || !code->is_string()) {
        throw ValidationError("'code' (string) is required.");
    }
    req.code = code->get<std::string>();

    const json* session = field(body, "sessionId", "chat_id");
    if (!session || !session->is_string() || session->get_ref<const std::string&>().empty()) {
        throw ValidationError("'sessionId' (non-empty string) is required.");
    }
    req.session_id = session->get<std::string>();
    if (!ArtifactStore::is_safe_component(req.session_id)) {
        throw ValidationError("'sessionId' must not contain path separators or '..'.");
    }

    if (const json* files = field(body, "inputFiles", "input_files")) {
        if (!files->is_array()) {
            throw ValidationError("'inputFiles' must be an array of {filename, url} objects.");
        }
        for (std::size_t i = 0; i < files->size(); ++i) {
            const json& f = (*files)[i];
            const std::string where = "inputFiles[" + std::to_string(i) + "]";
            if (!f.is_object()) {
                throw ValidationError(where + " must be an object.");
            }
            auto name = f.find("filename");
            auto url = f.find("url");
            if (name == f.end() || !name->is_string()) {
                throw ValidationError(where + ".filename (string) is required.");
            }
            if (url == f.end() || !url->is_string()) {
                throw ValidationError(where + ".url (string) is required.");
            }
            req.input_files.push_back(InputFileSpec{name->get<std::string>(), url->get<std::string>()});
        }
    }

    if (const json* t = field(body, "timeoutSeconds", "timeout")) {
        if (t->is_number()) {
            req.timeout_seconds = t->get<double>();
        } else {
            std::cerr << "[service] Ignoring non-numeric timeout: " << t->dump() << std::endl;
        }
    }
    return req;
}

json to_json(const ExecutionResult& r) {
    json j = json::object();
    j["stdout"] = r.stdout_text;
    j["stderr"] = r.stderr_text;
    j["success"] = r.success;
    if (r.error_message) j["error"] = *r.error_message;
    if (r.artifact_reference) j["artifactReference"] = *r.artifact_reference;
    return j;
}

// --------------------- result assembly ---------------------

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::string stderr_summary(const std::string& raw) {
    std::string filtered = trim(filter_instrumentation_lines(raw));
    return filtered.empty() ? "" : "\nStderr:\n" + filtered;
}

ExecutionResult assemble_result(const StageReport& staged, const RunOutcome& run,
                                const PromotionResult& promoted, double timeout_seconds,
                                const std::string& interpreter) {
    ExecutionResult r;
    r.stdout_text = run.stdout_text;

    std::string err = staged.warnings();
    err += run.stderr_text;
    auto append_line = [&err](const std::string& line) {
        if (!err.empty() && err.back() != '\n') err += "\n";
        err += line + "\n";
    };
    if (run.stdout_truncated) append_line("[Warning: stdout truncated by the service]");
    if (run.stderr_truncated) append_line("[Warning: stderr truncated by the service]");
    if (!promoted.warning.empty()) append_line(promoted.warning);
    r.stderr_text = std::move(err);

    std::ostringstream msg;
    switch (run.status) {
    case RunStatus::Exited:
        r.success = run.exit_code == 0;
        if (!r.success) {
            msg << "Code execution failed with return code " << run.exit_code << stderr_summary(run.stderr_text);
        }
        break;
    case RunStatus::Signalled:
        msg << "Code execution terminated by signal " << run.term_signal << stderr_summary(run.stderr_text);
        break;
    case RunStatus::TimedOut:
        msg << "Code execution timed out after " << timeout_seconds << " seconds.";
        break;
    case RunStatus::SpawnFailed:
        if (run.interpreter_missing) {
            msg << "Error: Python interpreter not found at " << interpreter;
        } else {
            msg << "Error: Failed to start Python interpreter " << interpreter << ": " << run.spawn_error;
        }
        break;
    }
    if (!r.success) r.error_message = msg.str();

    r.artifact_reference = promoted.reference;
    return r;
}

// --------------------- orchestration ---------------------

ExecutionService::ExecutionService(const ServiceConfig& cfg, IFetcher& fetcher, IExecutor& executor,
                                   const ArtifactStore& store)
    : cfg_(cfg), fetcher_(fetcher), executor_(executor), store_(store) {}

ExecutionResult ExecutionService::execute(const ExecutionRequest& req) const {
    ExecutionResult result;

    double timeout = effective_timeout(req.timeout_seconds, cfg_);
    if (req.timeout_seconds && *req.timeout_seconds != timeout) {
        std::cerr << "[service] Requested timeout " << *req.timeout_seconds << "s adjusted to " << timeout << "s" << std::endl;
    }

    try {
        WorkArea area = WorkArea::open(cfg_.work_root);

        auto fetch_timeout = std::chrono::milliseconds(static_cast<long long>(cfg_.fetch_timeout * 1000));
        InputStager stager(fetcher_, cfg_.base_origin, fetch_timeout);
        StageReport staged = stager.stage(area, req.input_files);

        std::string script = assemble_script(req.code);
        RunOutcome run = executor_.run(area.path(), script, timeout);

        // a killed or never started interpreter leaves nothing worth keeping
        PromotionResult promoted;
        if (run.status == RunStatus::Exited || run.status == RunStatus::Signalled) {
            promoted = store_.promote(area.path(), req.session_id);
        }

        result = assemble_result(staged, run, promoted, timeout, executor_.interpreter());
        area.close();
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = std::string("An unexpected error occurred during code execution: ") + e.what();
        std::cerr << "[service] " << *result.error_message << std::endl;
    }

    if (result.success) {
        std::cout << "[service] Execution for session " << req.session_id << " succeeded"
                  << (result.artifact_reference ? " with artifact " + *result.artifact_reference : "") << std::endl;
    } else {
        std::cerr << "[service] Execution for session " << req.session_id << " failed: "
                  << result.error_message.value_or("") << std::endl;
    }
    return result;
}
