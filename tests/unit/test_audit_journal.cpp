#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "audit/audit_journal.hpp"
#include "core/config/session_id.hpp"
#include "test_support.hpp"

namespace {

using tollgate::audit::AuditJournal;
using tollgate::audit::EventKind;
using tollgate::core::errors::get_error;
using tollgate::core::errors::get_value;
using tollgate::core::errors::is_error;
using tollgate::test_support::TempWorkspace;

std::vector<nlohmann::json> read_events(const std::filesystem::path& path) {
    std::vector<nlohmann::json> events;
    const auto text = tollgate::test_support::read_text(path);
    for (const auto& line : tollgate::audit::split_lines(text)) {
        events.push_back(nlohmann::json::parse(line));
    }
    return events;
}

TEST(AuditJournalTest, AppendsOneJsonLinePerEvent) {
    TempWorkspace workspace;
    AuditJournal journal(workspace.root(), "session-1");

    journal.emit(EventKind::Bash, "ls -la");
    journal.emit_block(EventKind::Diff, "PATCH a.py", "-old\n+new", 60);

    auto path = journal.journal_path();
    ASSERT_FALSE(is_error(path));
    EXPECT_EQ(get_value(path),
              workspace.root() / ".tollgate" / "audit" / "session-1.jsonl");

    const auto events = read_events(get_value(path));
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].at("event"), "message");
    EXPECT_EQ(events[0].at("session_id"), "session-1");
    EXPECT_EQ(events[0].at("kind"), "bash");
    EXPECT_EQ(events[0].at("message"), "ls -la");
    EXPECT_TRUE(events[0].contains("ts_unix_ms"));

    EXPECT_EQ(events[1].at("event"), "block");
    EXPECT_EQ(events[1].at("kind"), "diff");
    EXPECT_EQ(events[1].at("label"), "PATCH a.py");
    EXPECT_EQ(events[1].at("body"), "-old\n+new");
    EXPECT_EQ(events[1].at("max_lines"), 60);
}

TEST(AuditJournalTest, RejectsMissingWorkspaceRoot) {
    TempWorkspace workspace;
    AuditJournal journal(workspace.root() / "missing", "session-1");

    auto path = journal.journal_path();
    ASSERT_TRUE(is_error(path));
    EXPECT_EQ(get_error(path).code, "invalid_workspace_root");

    journal.emit(EventKind::Read, "ignored");
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "missing"));
}

TEST(AuditJournalTest, RejectsUnsafeSessionIds) {
    TempWorkspace workspace;
    for (const std::string id : {"", "../escape", "a/b"}) {
        AuditJournal journal(workspace.root(), id);
        auto path = journal.journal_path();
        ASSERT_TRUE(is_error(path)) << id;
        EXPECT_EQ(get_error(path).code, "invalid_session_id");
    }
}

TEST(AuditJournalTest, GeneratedSessionIdsAreUsable) {
    const auto id = tollgate::core::config::generate_session_id();
    EXPECT_EQ(id.rfind("session-", 0), 0u);
    EXPECT_TRUE(tollgate::core::config::is_valid_session_id(id));
    EXPECT_NE(id, tollgate::core::config::generate_session_id());
}

}  // namespace
