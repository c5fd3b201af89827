#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include "app/cli_parser.hpp"
#include "audit/audit_journal.hpp"
#include "audit/event_sink.hpp"
#include "core/config/execution_limits.hpp"
#include "core/config/policy_config.hpp"
#include "core/config/session_context.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/tool_catalog.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_host.hpp"

int main(int argc, char* argv[]) {
    // 1. Generate a unique Session ID for this invocation
    const std::string session_id = tollgate::core::config::generate_session_id();

    // 2. Register the Session ID with the Global Logger
    tollgate::core::logging::Logger::get().set_session_id(session_id);

    // 3. Parse CLI input and return normalized input errors
    auto parsed = tollgate::app::cli::parse_and_validate(argc, argv);
    if (tollgate::core::errors::is_error(parsed)) {
        const auto& err = tollgate::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& req = tollgate::core::errors::get_value(parsed);
    if (req.verbose) {
        tollgate::core::logging::Logger::get().set_min_level(
            tollgate::core::logging::LogLevel::DEBUG);
    }

    if (req.command == tollgate::protocol::CliCommand::Tools) {
        std::cout << tollgate::protocol::ToolCatalog::definitions(req.interactive,
                                                                  req.allowed_tools)
                         .dump(2)
                  << std::endl;
        return 0;
    }

    if (req.allowed_tools.has_value()) {
        const std::string requested = tollgate::tools::canonical_tool_name(req.tool_name);
        bool permitted = false;
        for (const auto& name : req.allowed_tools.value()) {
            if (tollgate::tools::canonical_tool_name(name) == requested) {
                permitted = true;
                break;
            }
        }
        if (!permitted) {
            LOG_ERROR("Input error [tool_not_allowed]: " + req.tool_name +
                      " is not in the allowed tool list");
            return 2;
        }
    }

    // Relative paths in tool arguments resolve against the working directory
    std::error_code ec;
    std::filesystem::current_path(req.working_directory, ec);
    if (ec) {
        LOG_ERROR("Failed to enter working directory " + req.working_directory.string() +
                  ": " + ec.message());
        return 2;
    }

    auto sink = std::make_shared<tollgate::audit::CompositeEventSink>();
    sink->add(std::make_shared<tollgate::audit::LogEventSink>());
    if (req.journal) {
        auto journal =
            std::make_shared<tollgate::audit::AuditJournal>(req.working_directory, session_id);
        auto journal_path = journal->journal_path();
        if (tollgate::core::errors::is_error(journal_path)) {
            const auto& err = tollgate::core::errors::get_error(journal_path);
            LOG_WARN("Audit journal unavailable [" + err.code + "]: " + err.message);
        } else {
            LOG_DEBUG("Audit journal: " +
                      tollgate::core::errors::get_value(journal_path).string());
            sink->add(journal);
        }
    }

    tollgate::core::config::ExecutionLimits limits;
    limits.command_timeout = std::chrono::seconds(req.timeout_secs);
    limits.install_prefix = req.install_prefix;

    tollgate::tools::ToolHost host(
        tollgate::core::config::SessionContext(req.interactive, session_id),
        tollgate::core::config::make_policy(req.owned_files, req.denied_files,
                                            req.deny_test_patterns),
        tollgate::core::config::QuotaConfig{}, limits, sink);

    const tollgate::protocol::ToolResult result =
        host.dispatch(tollgate::protocol::ToolCall{session_id, req.tool_name, req.arguments});
    if (result.success) {
        std::cout << result.output << std::endl;
        return 0;
    }

    std::cout << result.error_message << std::endl;
    LOG_DEBUG("Tool failed [" + result.error_code + "] after " +
              std::to_string(static_cast<long long>(result.duration_ms)) + "ms");
    return result.error_category == "input" ? 2 : 1;
}
