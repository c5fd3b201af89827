#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/policy_config.hpp"
#include "policy/path_access.hpp"
#include "test_support.hpp"

namespace {

using tollgate::core::config::make_policy;
using tollgate::core::errors::ErrorCategory;
using tollgate::core::errors::get_error;
using tollgate::core::errors::get_value;
using tollgate::core::errors::is_error;
using tollgate::policy::PathAccessController;
using tollgate::test_support::TempWorkspace;
using tollgate::test_support::write_text;
using Paths = std::vector<std::filesystem::path>;

TEST(PathAccessTest, UnrestrictedPolicyPermitsAndCanonicalizes) {
    TempWorkspace workspace;
    const PathAccessController access(make_policy(std::nullopt, std::nullopt, false));

    auto result = access.check_write(workspace.root() / "src" / ".." / "main.cpp");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), workspace.root() / "main.cpp");
}

TEST(PathAccessTest, EmptyOwnedListDeniesEveryWrite) {
    TempWorkspace workspace;
    const PathAccessController access(make_policy(Paths{}, std::nullopt, false));

    auto result = access.check_write(workspace.root() / "main.cpp");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::PolicyDenied);
    EXPECT_EQ(get_error(result).code, "not_owned");
    EXPECT_TRUE(get_error(result).permitted.empty());
}

TEST(PathAccessTest, OwnedListPermitsOnlyListedFiles) {
    TempWorkspace workspace;
    const auto owned = workspace.root() / "a.py";
    const PathAccessController access(make_policy(Paths{owned}, std::nullopt, false));

    EXPECT_FALSE(is_error(access.check_write(owned)));

    auto denied = access.check_write(workspace.root() / "b.py");
    ASSERT_TRUE(is_error(denied));
    const auto& error = get_error(denied);
    EXPECT_EQ(error.code, "not_owned");
    ASSERT_EQ(error.permitted.size(), 1u);
    EXPECT_EQ(error.permitted.front(), owned.string());
    EXPECT_NE(error.message.find(owned.string()), std::string::npos);
}

TEST(PathAccessTest, DenylistTakesPrecedenceOverOwnership) {
    TempWorkspace workspace;
    const auto file = workspace.root() / "config.py";
    const PathAccessController access(make_policy(Paths{file}, Paths{file}, false));

    auto result = access.check_write(file);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "denied_file");
}

TEST(PathAccessTest, SymlinkIsJudgedByItsTarget) {
    TempWorkspace workspace;
    const auto target = workspace.root() / "real.txt";
    const auto link = workspace.root() / "alias.txt";
    write_text(target, "x");
    std::filesystem::create_symlink(target, link);

    const PathAccessController owns_target(make_policy(Paths{target}, std::nullopt, false));
    auto permitted = owns_target.check_write(link);
    ASSERT_FALSE(is_error(permitted));
    EXPECT_EQ(get_value(permitted), target);

    const PathAccessController denies_target(make_policy(std::nullopt, Paths{target}, false));
    auto denied = denies_target.check_write(link);
    ASSERT_TRUE(is_error(denied));
    EXPECT_EQ(get_error(denied).code, "denied_file");
}

TEST(PathAccessTest, OwningALinkLocationGrantsNothingElse) {
    TempWorkspace workspace;
    const auto target = workspace.root() / "elsewhere.txt";
    const auto link = workspace.root() / "mine.txt";
    write_text(target, "x");
    std::filesystem::create_symlink(target, link);

    // The allowlist is canonicalized as well, so owning the link means owning
    // its target and nothing at the link's literal location.
    const PathAccessController access(make_policy(Paths{link}, std::nullopt, false));
    auto result = access.check_write(target);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), target);
}

TEST(PathAccessTest, DanglingSymlinkResolvesToItsTarget) {
    TempWorkspace workspace;
    const auto target = workspace.root() / "not_yet.txt";
    const auto link = workspace.root() / "dangling.txt";
    std::filesystem::create_symlink(target, link);

    const PathAccessController access(make_policy(std::nullopt, Paths{target}, false));
    auto result = access.check_write(link);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "denied_file");
}

TEST(PathAccessTest, TestFilePatternsDenyEvenOwnedFiles) {
    TempWorkspace workspace;
    const auto test_file = workspace.root() / "tests" / "check_api.py";
    const PathAccessController access(make_policy(Paths{test_file}, std::nullopt, true));

    auto result = access.check_write(test_file);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "test_file_pattern");

    const PathAccessController lenient(make_policy(Paths{test_file}, std::nullopt, false));
    EXPECT_FALSE(is_error(lenient.check_write(test_file)));
}

TEST(PathAccessTest, RecognizesTestFileConventions) {
    for (const std::string path :
         {"/p/src/test_main.py", "/p/pkg/foo_test.go", "/p/lib/user_spec.rb", "/p/tests/x.py",
          "/p/test/x.c", "/p/spec/x.rb", "/p/web/__tests__/a.js", "/p/conftest.py",
          "/p/web/a.test.ts", "/p/src/TestParser.java"}) {
        EXPECT_TRUE(PathAccessController::matches_test_pattern(path)) << path;
    }
    for (const std::string path :
         {"/p/src/main.py", "/p/src/contest.py", "/p/testing/x.py", "/p/src/latest.txt",
          "/p/src/Tester.java"}) {
        EXPECT_FALSE(PathAccessController::matches_test_pattern(path)) << path;
    }
}

TEST(PathAccessTest, StateDirectoryIsAlwaysProtected) {
    TempWorkspace workspace;
    const auto state_file = workspace.root() / ".tollgate" / "audit" / "s.jsonl";
    const PathAccessController access(make_policy(Paths{state_file}, std::nullopt, false));

    auto result = access.check_write(state_file);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "internal_state_path");

    // A symlink pointing into the state directory is caught by its target.
    std::filesystem::create_directories(state_file.parent_path());
    const auto link = workspace.root() / "innocent.txt";
    std::filesystem::create_symlink(state_file, link);
    const PathAccessController open_access(make_policy(std::nullopt, std::nullopt, false));
    auto via_link = open_access.check_write(link);
    ASSERT_TRUE(is_error(via_link));
    EXPECT_EQ(get_error(via_link).code, "internal_state_path");
}

TEST(PathAccessTest, EmptyPathIsAnInputError) {
    const PathAccessController access;
    auto result = access.check_write("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
}

}  // namespace
