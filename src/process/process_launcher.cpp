#include "process/process_launcher.hpp"

#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace tollgate::process {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

constexpr std::size_t kDisplayLimit = 200;

std::string clip(const std::string& text) {
    return text.size() <= kDisplayLimit ? text : text.substr(0, kDisplayLimit);
}

std::string format_seconds(const std::chrono::milliseconds timeout) {
    const auto ms = timeout.count();
    if (ms % 1000 == 0) {
        return std::to_string(ms / 1000) + "s";
    }
    return std::to_string(ms) + "ms";
}

core::errors::Result<std::filesystem::path> check_workdir(const std::filesystem::path& workdir) {
    const std::filesystem::path dir = workdir.empty() ? std::filesystem::path(".") : workdir;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        ToolError error{ErrorCategory::NotFound,
                        "Working directory does not exist: " + dir.string(),
                        "workdir_not_found"};
        error.path = dir.string();
        return error;
    }
    return dir;
}

}  // namespace

std::string CommandOutcome::render() const {
    return "Stdout:\n" + stdout_text + "\nStderr:\n" + stderr_text +
           "\nExit Code: " + std::to_string(exit_code);
}

ProcessLauncher::ProcessLauncher(policy::CommandGuard guard,
                                 core::config::ExecutionLimits limits,
                                 std::shared_ptr<ProcessRunner> runner,
                                 std::shared_ptr<audit::EventSink> sink)
    : guard_(std::move(guard)),
      limits_(std::move(limits)),
      runner_(std::move(runner)),
      sink_(std::move(sink)) {
    if (!runner_) {
        runner_ = std::make_shared<PosixProcessRunner>();
    }
    if (!sink_) {
        sink_ = std::make_shared<audit::NullEventSink>();
    }
}

core::errors::Result<CommandOutcome> ProcessLauncher::run(
    const std::string& command, const std::filesystem::path& workdir,
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    if (command.find_first_not_of(" \t\r\n") == std::string::npos) {
        return ToolError{ErrorCategory::Input, "Command cannot be empty.", "empty_command"};
    }
    auto dir = check_workdir(workdir);
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }

    const policy::Verdict verdict = guard_.evaluate(command, core::errors::get_value(dir));
    if (!verdict.allowed()) {
        sink_->emit(audit::EventKind::Warning, "BLOCKED dangerous command: " + clip(command));
        ToolError error{ErrorCategory::CommandBlocked,
                        "command blocked by safety filter. Pattern matched: " +
                            verdict.rule->pattern,
                        "command_blocked"};
        error.pattern = verdict.rule->pattern;
        error.hint = "(" + verdict.rule->description + ")";
        return error;
    }
    if (verdict.scoped_delete) {
        LOG_DEBUG("Recursive delete confined to workdir: " + clip(command));
    }

    sink_->emit(audit::EventKind::Bash, clip(command));

    ProcessRequest request;
    request.argv = {"/bin/sh", "-c", command};
    request.working_directory = core::errors::get_value(dir);
    request.timeout = limits_.command_timeout;
    request.cancel_token = std::move(cancel_token);
    request.environment = activated_environment(request.working_directory);
    return execute(std::move(request), command);
}

core::errors::Result<CommandOutcome> ProcessLauncher::run_argv(
    const std::vector<std::string>& argv, const std::filesystem::path& workdir,
    const std::chrono::milliseconds timeout) const {
    if (argv.empty() || argv.front().empty()) {
        return ToolError{ErrorCategory::Input, "Command cannot be empty.", "empty_command"};
    }
    auto dir = check_workdir(workdir);
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }

    ProcessRequest request;
    request.argv = argv;
    request.working_directory = core::errors::get_value(dir);
    request.timeout = timeout;

    std::string display;
    for (const auto& arg : argv) {
        display += (display.empty() ? "" : " ") + arg;
    }
    return execute(std::move(request), display);
}

core::errors::Result<CommandOutcome> ProcessLauncher::execute(
    ProcessRequest request, const std::string& display) const {
    const auto timeout = request.timeout;
    auto captured = runner_->run(request);
    if (core::errors::is_error(captured)) {
        LOG_ERROR("Failed to run '" + clip(display) +
                  "': " + core::errors::get_error(captured).message);
        return core::errors::get_error(captured);
    }
    const ProcessCapture& capture = core::errors::get_value(captured);

    if (capture.timed_out) {
        LOG_WARN("Command timed out after " + format_seconds(timeout) + ": " + clip(display));
        ToolError error{ErrorCategory::Timeout,
                        "command timed out after " + format_seconds(timeout) + ": " +
                            clip(display),
                        "command_timeout"};
        error.limit = static_cast<std::uintmax_t>(timeout.count());
        return error;
    }
    if (capture.cancelled) {
        return ToolError{ErrorCategory::Timeout, "command cancelled: " + clip(display),
                         "command_cancelled"};
    }

    CommandOutcome outcome;
    outcome.stdout_text = capture.stdout_text;
    outcome.stderr_text = capture.stderr_text;
    outcome.exit_code = capture.exit_code;
    outcome.duration_ms = capture.duration_ms;
    LOG_DEBUG("Command exited with " + std::to_string(outcome.exit_code) + " in " +
              std::to_string(static_cast<long long>(outcome.duration_ms)) + "ms");
    return outcome;
}

}  // namespace tollgate::process
