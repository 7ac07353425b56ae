#pragma once
#include <filesystem>
#include <string>

enum class RunStatus {
    Exited,      // exit_code is valid
    Signalled,   // term_signal is valid
    TimedOut,    // process group killed at the deadline
    SpawnFailed, // interpreter never started, see spawn_error
};

struct RunOutcome {
    RunStatus status{RunStatus::SpawnFailed};
    int exit_code{-1};
    int term_signal{0};
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::string spawn_error;
    bool interpreter_missing{false};
    double ms{0.0};

    bool ok() const { return status == RunStatus::Exited && exit_code == 0; }
};

class IExecutor {
public:
    virtual ~IExecutor() = default;
    // Runs `script` from inside work_dir. Errors of the script are reported in
    // the outcome, never thrown.
    virtual RunOutcome run(const std::filesystem::path& work_dir, const std::string& script,
                           double timeout_seconds) = 0;
    virtual const std::string& interpreter() const = 0;
};
