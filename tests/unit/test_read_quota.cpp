#include <limits>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "quota/read_quota.hpp"
#include "test_support.hpp"

namespace {

using tollgate::audit::EventKind;
using tollgate::core::config::QuotaConfig;
using tollgate::core::errors::ErrorCategory;
using tollgate::core::errors::get_error;
using tollgate::core::errors::get_value;
using tollgate::core::errors::is_error;
using tollgate::quota::format_bytes;
using tollgate::quota::ReadQuotaEnforcer;
using tollgate::test_support::RecordingSink;
using tollgate::test_support::TempWorkspace;
using tollgate::test_support::write_text;

QuotaConfig small_quota() {
    QuotaConfig quota;
    quota.max_read_file_bytes = 64;
    quota.max_batch_file_bytes = 64;
    quota.max_batch_files = 100;
    quota.max_listing_results = 50;
    return quota;
}

// n bytes spread over 8-byte lines ("xxxxxxx\n").
std::string lines_of_size(const std::size_t n) {
    std::string text;
    while (text.size() < n) {
        text += (text.size() % 8 == 7) ? '\n' : 'x';
    }
    return text;
}

TEST(ReadQuotaTest, FileAtTheCapIsReadable) {
    TempWorkspace workspace;
    const auto file = workspace.root() / "exact.txt";
    write_text(file, lines_of_size(64));

    const ReadQuotaEnforcer reader(small_quota());
    auto result = reader.read_file(file);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).content.size(), 64u);
    EXPECT_FALSE(get_value(result).ranged);
}

TEST(ReadQuotaTest, FileOverTheCapReportsLimitAndActualSize) {
    TempWorkspace workspace;
    const auto file = workspace.root() / "over.txt";
    write_text(file, lines_of_size(65));

    const ReadQuotaEnforcer reader(small_quota());
    auto result = reader.read_file(file);
    ASSERT_TRUE(is_error(result));
    const auto& error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::QuotaExceeded);
    EXPECT_EQ(error.code, "file_too_large");
    EXPECT_EQ(error.limit.value(), 64u);
    EXPECT_EQ(error.actual.value(), 65u);
    EXPECT_NE(error.message.find("64 bytes"), std::string::npos);
    EXPECT_NE(error.message.find("65 bytes"), std::string::npos);

    auto ranged = reader.read_file(file, std::nullopt, 2);
    ASSERT_FALSE(is_error(ranged));
    EXPECT_EQ(get_value(ranged).content, "xxxxxxx\nxxxxxxx\n");
    EXPECT_EQ(get_value(ranged).render(), "[Lines 1-2 of 9]\nxxxxxxx\nxxxxxxx\n");
}

TEST(ReadQuotaTest, RangedReadSelectsLines) {
    TempWorkspace workspace;
    const auto file = workspace.root() / "abcd.txt";
    write_text(file, "a\nb\nc\nd\n");

    const ReadQuotaEnforcer reader(small_quota());
    auto middle = reader.read_file(file, 2, 2);
    ASSERT_FALSE(is_error(middle));
    EXPECT_EQ(get_value(middle).content, "b\nc\n");
    EXPECT_EQ(get_value(middle).first_line, 2u);
    EXPECT_EQ(get_value(middle).last_line, 3u);
    EXPECT_EQ(get_value(middle).total_lines, 4u);

    auto tail = reader.read_file(file, 3, std::nullopt);
    ASSERT_FALSE(is_error(tail));
    EXPECT_EQ(get_value(tail).content, "c\nd\n");

    auto past_end = reader.read_file(file, 10, 5);
    ASSERT_FALSE(is_error(past_end));
    EXPECT_EQ(get_value(past_end).render(), "[Lines 10-9 of 4]\n");
    EXPECT_TRUE(get_value(past_end).content.empty());
}

TEST(ReadQuotaTest, HugeLimitReadsToEndOfFile) {
    TempWorkspace workspace;
    const auto file = workspace.root() / "ten.txt";
    std::string text;
    for (int i = 1; i <= 10; ++i) {
        text += std::to_string(i) + "\n";
    }
    write_text(file, text);

    const ReadQuotaEnforcer reader(small_quota());
    auto result = reader.read_file(file, 5, std::numeric_limits<std::size_t>::max());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).render(), "[Lines 5-10 of 10]\n5\n6\n7\n8\n9\n10\n");
}

TEST(ReadQuotaTest, RangedReadIsStillBoundedBySliceSize) {
    TempWorkspace workspace;
    const auto file = workspace.root() / "wide.txt";
    write_text(file, std::string(100, 'w') + "\nshort\n");

    const ReadQuotaEnforcer reader(small_quota());
    auto result = reader.read_file(file, std::nullopt, 1);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "slice_too_large");

    auto second = reader.read_file(file, 2, 1);
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).content, "short\n");
}

TEST(ReadQuotaTest, RepeatedReadsAreIdentical) {
    TempWorkspace workspace;
    const auto file = workspace.root() / "same.txt";
    write_text(file, "line one\nline two");

    const ReadQuotaEnforcer reader(small_quota());
    auto first = reader.read_file(file);
    auto second = reader.read_file(file);
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(first).content, get_value(second).content);
}

TEST(ReadQuotaTest, MissingFilesAndDirectoriesAreErrors) {
    TempWorkspace workspace;
    const ReadQuotaEnforcer reader(small_quota());

    auto missing = reader.read_file(workspace.root() / "nope.txt");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).category, ErrorCategory::NotFound);

    auto directory = reader.read_file(workspace.root());
    ASSERT_TRUE(is_error(directory));
    EXPECT_EQ(get_error(directory).code, "not_regular_file");
}

TEST(ReadQuotaTest, BatchReadKeysByOriginalPath) {
    TempWorkspace workspace;
    std::vector<std::string> paths;
    for (const std::string name : {"one.txt", "two.txt", "three.txt"}) {
        write_text(workspace.root() / name, "content of " + name);
        paths.push_back((workspace.root() / name).string());
    }

    const ReadQuotaEnforcer reader(small_quota());
    auto result = reader.read_files(paths);
    ASSERT_FALSE(is_error(result));
    const auto payload = nlohmann::json::parse(get_value(result).to_json());
    ASSERT_EQ(payload.size(), 3u);
    EXPECT_EQ(payload.at(paths[0]).get<std::string>(), "content of one.txt");
    EXPECT_EQ(payload.at(paths[1]).get<std::string>(), "content of two.txt");
    EXPECT_EQ(payload.at(paths[2]).get<std::string>(), "content of three.txt");
}

TEST(ReadQuotaTest, BatchReadMarksOversizedEntryOnly) {
    TempWorkspace workspace;
    write_text(workspace.root() / "small.txt", "small");
    write_text(workspace.root() / "big.txt", lines_of_size(200));
    const std::vector<std::string> paths = {(workspace.root() / "small.txt").string(),
                                            (workspace.root() / "big.txt").string()};

    const ReadQuotaEnforcer reader(small_quota());
    auto result = reader.read_files(paths);
    ASSERT_FALSE(is_error(result));
    const auto& batch = get_value(result);
    ASSERT_EQ(batch.entries.size(), 2u);
    EXPECT_EQ(batch.entries[0].content.value(), "small");
    ASSERT_TRUE(batch.entries[1].error.has_value());
    EXPECT_EQ(batch.entries[1].error->code, "batch_file_too_large");

    const auto payload = nlohmann::json::parse(batch.to_json());
    EXPECT_EQ(payload.at(paths[0]).get<std::string>(), "small");
    EXPECT_NE(payload.at(paths[1]).get<std::string>().find("too large"), std::string::npos);
}

TEST(ReadQuotaTest, BatchReadTruncatesToFileCountWithOneWarning) {
    TempWorkspace workspace;
    std::vector<std::string> paths;
    for (int i = 0; i < 3; ++i) {
        const auto file = workspace.root() / ("f" + std::to_string(i) + ".txt");
        write_text(file, "x");
        paths.push_back(file.string());
    }

    auto quota = small_quota();
    quota.max_batch_files = 2;
    auto sink = std::make_shared<RecordingSink>();
    const ReadQuotaEnforcer reader(quota, sink);
    auto result = reader.read_files(paths);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).entries.size(), 2u);
    EXPECT_TRUE(get_value(result).truncated);
    EXPECT_EQ(get_value(result).requested, 3u);
    EXPECT_EQ(sink->count(EventKind::Warning), 1u);
}

TEST(ReadQuotaTest, ListingIsCappedWithOneWarning) {
    TempWorkspace workspace;
    for (int i = 0; i < 60; ++i) {
        write_text(workspace.root() / ("file" + std::to_string(i) + ".txt"), "x");
    }

    auto sink = std::make_shared<RecordingSink>();
    const ReadQuotaEnforcer reader(small_quota(), sink);
    auto result = reader.list_files("*.txt", workspace.root());
    ASSERT_FALSE(is_error(result));
    const auto& listing = get_value(result);
    EXPECT_EQ(listing.paths.size(), 50u);
    EXPECT_EQ(listing.total_matches, 60u);
    EXPECT_TRUE(listing.truncated);
    ASSERT_EQ(listing.warnings.size(), 1u);
    EXPECT_EQ(sink->count(EventKind::Warning), 1u);
}

TEST(ReadQuotaTest, ListingUnderTheCapIsUntouched) {
    TempWorkspace workspace;
    write_text(workspace.root() / "a.txt", "x");
    write_text(workspace.root() / "b.md", "x");

    auto sink = std::make_shared<RecordingSink>();
    const ReadQuotaEnforcer reader(small_quota(), sink);
    auto result = reader.list_files("*.txt", workspace.root());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).paths, std::vector<std::string>{"a.txt"});
    EXPECT_FALSE(get_value(result).truncated);
    EXPECT_EQ(sink->count(EventKind::Warning), 0u);
}

TEST(ReadQuotaTest, FormatsByteCounts) {
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1536), "1.5 KB");
    EXPECT_EQ(format_bytes(1024 * 1024), "1.0 MB");
}

}  // namespace
