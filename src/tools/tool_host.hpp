#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "audit/event_sink.hpp"
#include "core/config/execution_limits.hpp"
#include "core/config/policy_config.hpp"
#include "core/config/quota_config.hpp"
#include "core/config/session_context.hpp"
#include "core/errors/tool_errors.hpp"
#include "mutation/mutation_executor.hpp"
#include "process/process_launcher.hpp"
#include "protocol/tool_contract.hpp"
#include "quota/read_quota.hpp"

namespace tollgate::tools {

struct SearchOutcome {
    quota::ListingResult matches;  // "file:line:text" entries
    std::string stderr_text;
    int exit_code = 0;

    std::string render() const;
};

// The tool-call surface. Every operation funnels through the policy, quota,
// mutation and process layers; nothing here touches the filesystem or spawns
// a process directly.
class ToolHost {
public:
    ToolHost(core::config::SessionContext session, core::config::PolicyConfig policy,
             core::config::QuotaConfig quota = {},
             core::config::ExecutionLimits limits = {},
             std::shared_ptr<audit::EventSink> sink = nullptr,
             std::shared_ptr<process::ProcessRunner> runner = nullptr);

    core::errors::Result<quota::FileSlice> read_file(
        const std::filesystem::path& path, std::optional<std::size_t> offset = std::nullopt,
        std::optional<std::size_t> limit = std::nullopt) const;

    core::errors::Result<mutation::WriteOutcome> write_file(
        const std::filesystem::path& path, const std::string& content) const;

    core::errors::Result<mutation::EditOutcome> edit_file(
        const std::filesystem::path& path, const std::string& old_string,
        const std::string& new_string) const;

    core::errors::Result<quota::BatchReadResult> read_files(
        const std::vector<std::string>& paths) const;

    core::errors::Result<quota::ListingResult> list_files(
        const std::string& pattern, const std::filesystem::path& workdir = ".") const;

    // grep -rn through the argument-list path; exit status 1 (no match) is
    // not an error.
    core::errors::Result<SearchOutcome> grep_files(
        const std::string& pattern, const std::filesystem::path& path = ".",
        const std::string& include = "*") const;

    core::errors::Result<process::CommandOutcome> run_bash(
        const std::string& command, const std::filesystem::path& workdir = ".",
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

    core::errors::Result<process::CommandOutcome> install_package(
        const std::string& spec) const;

    // Returns the default answer (first option, else "yes") without prompting
    // when the session is non-interactive or stdin is not a terminal.
    std::string ask_user(const std::string& question,
                         const std::vector<std::string>& options = {}) const;

    // Never throws; malformed calls come back with success=false.
    protocol::ToolResult dispatch(const protocol::ToolCall& call) const;

    const core::config::SessionContext& session() const { return session_; }

private:
    core::config::SessionContext session_;
    core::config::ExecutionLimits limits_;
    std::shared_ptr<audit::EventSink> sink_;
    quota::ReadQuotaEnforcer reader_;
    mutation::MutationExecutor mutator_;
    process::ProcessLauncher launcher_;
};

// Maps function-calling names (Read, Bash, ...) to the snake_case operation
// names; unknown names come back unchanged.
std::string canonical_tool_name(const std::string& name);

}  // namespace tollgate::tools
