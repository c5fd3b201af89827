#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "audit/event_sink.hpp"
#include "core/config/quota_config.hpp"
#include "core/errors/tool_errors.hpp"

namespace tollgate::quota {

struct FileSlice {
    std::string content;
    bool ranged = false;
    // 1-indexed, inclusive; both 0 when the range selected nothing.
    std::size_t first_line = 0;
    std::size_t last_line = 0;
    std::size_t total_lines = 0;

    // Ranged reads carry a "[Lines a-b of N]" header.
    std::string render() const;
};

struct BatchEntry {
    std::string path;  // exactly as the caller supplied it
    std::optional<std::string> content;
    std::optional<core::errors::ToolError> error;
};

struct BatchReadResult {
    std::vector<BatchEntry> entries;
    std::size_t requested = 0;
    bool truncated = false;
    std::vector<std::string> warnings;

    // JSON object keyed by original path; failed entries map to "Error: ...".
    std::string to_json() const;
};

struct ListingResult {
    std::vector<std::string> paths;
    std::size_t total_matches = 0;
    bool truncated = false;
    std::vector<std::string> warnings;
};

class ReadQuotaEnforcer {
public:
    explicit ReadQuotaEnforcer(core::config::QuotaConfig quota = {},
                               std::shared_ptr<audit::EventSink> sink = nullptr);

    // Whole-file reads are refused above max_read_file_bytes. Supplying offset
    // or limit switches to a line-ranged read, bounded by the size of the
    // selected slice instead of the file.
    core::errors::Result<FileSlice> read_file(
        const std::filesystem::path& path,
        std::optional<std::size_t> offset = std::nullopt,
        std::optional<std::size_t> limit = std::nullopt) const;

    core::errors::Result<BatchReadResult> read_files(
        const std::vector<std::string>& paths) const;

    core::errors::Result<ListingResult> list_files(
        const std::string& pattern, const std::filesystem::path& workdir) const;

    // Truncates an already-sorted result list to max_listing_results and
    // emits one warning when anything was dropped.
    ListingResult cap_results(std::vector<std::string> results,
                              const std::string& what) const;

    const core::config::QuotaConfig& quota() const { return quota_; }

private:
    core::config::QuotaConfig quota_;
    std::shared_ptr<audit::EventSink> sink_;
};

// 1536 -> "1.5 KB"
std::string format_bytes(std::uintmax_t bytes);

}  // namespace tollgate::quota
