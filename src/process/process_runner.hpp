#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"

namespace tollgate::process {

struct ProcessRequest {
    // argv[0] is resolved through PATH of the child environment.
    std::vector<std::string> argv;
    std::filesystem::path working_directory = ".";
    std::chrono::milliseconds timeout{0};  // 0 disables the bound
    std::shared_ptr<std::atomic_bool> cancel_token;
    // "KEY=VALUE" entries; empty inherits the parent environment.
    std::vector<std::string> environment;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Seam between the launcher and the operating system.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual core::errors::Result<ProcessCapture> run(const ProcessRequest& request) = 0;
};

// fork/exec with the child in its own process group. Timeout and
// cancellation SIGKILL the whole group, background children included.
class PosixProcessRunner : public ProcessRunner {
public:
    core::errors::Result<ProcessCapture> run(const ProcessRequest& request) override;
};

// Current environment with a project virtualenv (.venv/bin, then venv/bin
// under workdir) activated: PATH prefixed, VIRTUAL_ENV set, PYTHONHOME unset.
std::vector<std::string> activated_environment(const std::filesystem::path& workdir);

}  // namespace tollgate::process
