#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include "audit/event_sink.hpp"
#include "core/errors/tool_errors.hpp"

namespace tollgate::audit {

// Append-only JSONL record of audit events, one file per session. Bodies are
// stored in full; max_lines is recorded but not applied.
class AuditJournal : public EventSink {
public:
    AuditJournal(std::filesystem::path workspace_root, std::string session_id,
                 std::filesystem::path journal_subdir =
                     std::filesystem::path(".tollgate") / "audit");

    void emit(EventKind kind, const std::string& message) override;
    void emit_block(EventKind kind, const std::string& label,
                    const std::string& body, std::size_t max_lines) override;

    core::errors::Result<std::filesystem::path> journal_path() const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& event_json);

    std::filesystem::path workspace_root_;
    std::string session_id_;
    std::filesystem::path journal_subdir_;
    std::mutex mutex_;
    bool reported_failure_ = false;
};

}  // namespace tollgate::audit
