#include "audit/audit_journal.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"

namespace tollgate::audit {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

AuditJournal::AuditJournal(std::filesystem::path workspace_root,
                           std::string session_id,
                           std::filesystem::path journal_subdir)
    : workspace_root_(std::move(workspace_root)),
      session_id_(std::move(session_id)),
      journal_subdir_(std::move(journal_subdir)) {}

core::errors::Result<std::filesystem::path> AuditJournal::journal_path() const {
    if (!core::config::is_valid_session_id(session_id_)) {
        return ToolError{ErrorCategory::Input,
                         "Session ID must be non-empty and filesystem-safe: '" +
                             session_id_ + "'",
                         "invalid_session_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return ToolError{ErrorCategory::NotFound,
                         "Workspace root is not a directory: " +
                             workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    const auto canonical_root =
        std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return ToolError{ErrorCategory::IOError,
                         "Unable to resolve workspace root: " +
                             workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    const auto journal_dir = canonical_root / journal_subdir_;
    std::filesystem::create_directories(journal_dir, ec);
    if (ec) {
        return ToolError{ErrorCategory::IOError,
                         "Unable to create journal directory: " +
                             journal_dir.string() + ": " + ec.message(),
                         "journal_dir_create_failed"};
    }

    return journal_dir / (session_id_ + ".jsonl");
}

core::errors::Result<std::filesystem::path> AuditJournal::append_event(
    const std::string& event_json) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path_result = journal_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return ToolError{ErrorCategory::IOError,
                         "Unable to open journal file: " + path.string(),
                         "journal_open_failed"};
    }

    out << event_json << "\n";
    out.flush();
    if (!out.good()) {
        return ToolError{ErrorCategory::IOError,
                         "Unable to write journal event: " + path.string(),
                         "journal_write_failed"};
    }
    return path;
}

void AuditJournal::emit(const EventKind kind, const std::string& message) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "message";
    event["session_id"] = session_id_;
    event["kind"] = to_string(kind);
    event["message"] = message;

    const auto result = append_event(event.dump(-1, ' ', false,
                                                json::error_handler_t::replace));
    if (core::errors::is_error(result) && !reported_failure_) {
        reported_failure_ = true;
        LOG_WARN("Audit journal disabled: " + core::errors::get_error(result).message);
    }
}

void AuditJournal::emit_block(const EventKind kind, const std::string& label,
                              const std::string& body,
                              const std::size_t max_lines) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "block";
    event["session_id"] = session_id_;
    event["kind"] = to_string(kind);
    event["label"] = label;
    event["body"] = body;
    event["max_lines"] = max_lines;

    const auto result = append_event(event.dump(-1, ' ', false,
                                                json::error_handler_t::replace));
    if (core::errors::is_error(result) && !reported_failure_) {
        reported_failure_ = true;
        LOG_WARN("Audit journal disabled: " + core::errors::get_error(result).message);
    }
}

}  // namespace tollgate::audit
