#pragma once
#include "iexecutor.hpp"
#include <cstddef>
#include <optional>
#include <string>

inline constexpr const char* kScriptFilename = "script.py";

// Runs a script file with an external interpreter in a child process.
// The child gets its own process group so a timeout takes its descendants too.
class ScriptExecutor : public IExecutor {
public:
    ScriptExecutor(std::string interpreter, std::size_t max_output_bytes);

    RunOutcome run(const std::filesystem::path& work_dir, const std::string& script,
                   double timeout_seconds) override;
    const std::string& interpreter() const override { return interpreter_; }

    // PATH lookup the way execvp would do it, done before fork.
    static std::optional<std::string> find_program(const std::string& name);

private:
    RunOutcome spawn_and_wait(const std::filesystem::path& work_dir, const std::string& program,
                              double timeout_seconds);

    std::string interpreter_;
    std::size_t max_output_bytes_;
};
