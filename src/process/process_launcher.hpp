#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "audit/event_sink.hpp"
#include "core/config/execution_limits.hpp"
#include "core/errors/tool_errors.hpp"
#include "policy/command_guard.hpp"
#include "process/process_runner.hpp"

namespace tollgate::process {

struct CommandOutcome {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;  // non-zero is reported, not treated as failure
    double duration_ms = 0.0;

    // "Stdout:\n...\nStderr:\n...\nExit Code: N"
    std::string render() const;
};

class ProcessLauncher {
public:
    ProcessLauncher(policy::CommandGuard guard, core::config::ExecutionLimits limits,
                    std::shared_ptr<ProcessRunner> runner = nullptr,
                    std::shared_ptr<audit::EventSink> sink = nullptr);

    // Shell command through /bin/sh -c, after the guard allows it.
    core::errors::Result<CommandOutcome> run(
        const std::string& command, const std::filesystem::path& workdir,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

    // Argument-list execution without a shell; the guard does not apply since
    // nothing is interpreted.
    core::errors::Result<CommandOutcome> run_argv(const std::vector<std::string>& argv,
                                                  const std::filesystem::path& workdir,
                                                  std::chrono::milliseconds timeout) const;

    const core::config::ExecutionLimits& limits() const { return limits_; }

private:
    core::errors::Result<CommandOutcome> execute(ProcessRequest request,
                                                 const std::string& display) const;

    policy::CommandGuard guard_;
    core::config::ExecutionLimits limits_;
    std::shared_ptr<ProcessRunner> runner_;
    std::shared_ptr<audit::EventSink> sink_;
};

}  // namespace tollgate::process
