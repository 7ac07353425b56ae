#pragma once
#include <nlohmann/json.hpp>

#include "artifact_store.hpp"
#include "config.hpp"
#include "execution_types.hpp"
#include "executors/iexecutor.hpp"
#include "http_fetcher.hpp"
#include "input_stager.hpp"

// Runs one request through stage -> assemble -> run -> promote -> result,
// with the work area torn down on every path. Holds no per-request state,
// so one instance serves all worker threads.
class ExecutionService {
public:
    using json = nlohmann::json;

    ExecutionService(const ServiceConfig& cfg, IFetcher& fetcher, IExecutor& executor, const ArtifactStore& store);

    ExecutionResult execute(const ExecutionRequest& req) const;

    const ServiceConfig& config() const { return cfg_; }

private:
    const ServiceConfig& cfg_;
    IFetcher& fetcher_;
    IExecutor& executor_;
    const ArtifactStore& store_;
};

// Throws ValidationError describing the first problem found.
ExecutionRequest parse_execution_request(const nlohmann::json& body);

nlohmann::json to_json(const ExecutionResult& r);

// Merges the phase outputs into the response record.
ExecutionResult assemble_result(const StageReport& staged, const RunOutcome& run,
                                const PromotionResult& promoted, double timeout_seconds,
                                const std::string& interpreter);
