#include "quota/read_quota.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "quota/glob.hpp"

namespace tollgate::quota {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

// Shared existence/type/size checks. Returns the file size.
core::errors::Result<std::uintmax_t> inspect_regular_file(
    const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        ToolError error{ErrorCategory::NotFound, "File not found: " + path.string(),
                        "file_not_found"};
        error.path = path.string();
        return error;
    }
    if (!std::filesystem::is_regular_file(status)) {
        ToolError error{ErrorCategory::IOError,
                        "Path is not a regular file: " + path.string(),
                        "not_regular_file"};
        error.path = path.string();
        return error;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        ToolError error{ErrorCategory::IOError,
                        "Unable to stat " + path.string() + ": " + ec.message(),
                        "stat_failed"};
        error.path = path.string();
        return error;
    }
    return size;
}

core::errors::Result<std::string> read_whole(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        ToolError error{ErrorCategory::IOError, "Failed to open file: " + path.string(),
                        "open_failed"};
        error.path = path.string();
        return error;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        ToolError error{ErrorCategory::IOError,
                        "I/O error while reading file: " + path.string(),
                        "read_failed"};
        error.path = path.string();
        return error;
    }
    return buffer.str();
}

ToolError too_large(const std::filesystem::path& path, const std::uintmax_t actual,
                    const std::uintmax_t limit, const std::string& code,
                    const std::string& message) {
    ToolError error{ErrorCategory::QuotaExceeded, message, code};
    error.path = path.string();
    error.limit = limit;
    error.actual = actual;
    return error;
}

std::string describe_size(const std::uintmax_t bytes) {
    return format_bytes(bytes) + " (" + std::to_string(bytes) + " bytes)";
}

}  // namespace

std::string format_bytes(const std::uintmax_t bytes) {
    static const char* const kUnits[] = {"KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value << " " << kUnits[unit];
    return out.str();
}

std::string FileSlice::render() const {
    if (!ranged) {
        return content;
    }
    return "[Lines " + std::to_string(first_line) + "-" + std::to_string(last_line) +
           " of " + std::to_string(total_lines) + "]\n" + content;
}

std::string BatchReadResult::to_json() const {
    nlohmann::ordered_json payload = nlohmann::ordered_json::object();
    for (const auto& entry : entries) {
        if (entry.content.has_value()) {
            payload[entry.path] = entry.content.value();
        } else if (entry.error.has_value()) {
            payload[entry.path] = core::errors::render(entry.error.value());
        }
    }
    return payload.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

ReadQuotaEnforcer::ReadQuotaEnforcer(core::config::QuotaConfig quota,
                                     std::shared_ptr<audit::EventSink> sink)
    : quota_(quota), sink_(std::move(sink)) {
    if (!sink_) {
        sink_ = std::make_shared<audit::NullEventSink>();
    }
}

core::errors::Result<FileSlice> ReadQuotaEnforcer::read_file(
    const std::filesystem::path& path, const std::optional<std::size_t> offset,
    const std::optional<std::size_t> limit) const {
    if (path.empty()) {
        return ToolError{ErrorCategory::Input, "Path cannot be empty.", "empty_path"};
    }

    auto inspected = inspect_regular_file(path);
    if (core::errors::is_error(inspected)) {
        return core::errors::get_error(inspected);
    }
    const std::uintmax_t size = core::errors::get_value(inspected);

    if (!offset.has_value() && !limit.has_value()) {
        if (size > quota_.max_read_file_bytes) {
            return too_large(
                path, size, quota_.max_read_file_bytes, "file_too_large",
                "File " + path.string() + " is too large to read at once: " +
                    describe_size(size) + " exceeds the " +
                    describe_size(quota_.max_read_file_bytes) +
                    " limit. Use offset and limit to read it in line ranges.");
        }
        auto content = read_whole(path);
        if (core::errors::is_error(content)) {
            return core::errors::get_error(content);
        }
        FileSlice slice;
        slice.content = core::errors::get_value(content);
        return slice;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        ToolError error{ErrorCategory::IOError, "Failed to open file: " + path.string(),
                        "open_failed"};
        error.path = path.string();
        return error;
    }

    // 1-indexed; 0 is treated as the first line. A zero limit reads to EOF.
    const std::size_t start = offset.has_value() && offset.value() > 0 ? offset.value() : 1;
    const bool bounded = limit.has_value() && limit.value() > 0;
    const std::size_t max_line = std::numeric_limits<std::size_t>::max();
    const std::size_t stop = !bounded ? 0
                             : limit.value() > max_line - start + 1
                                 ? max_line
                                 : start + limit.value() - 1;

    FileSlice slice;
    slice.ranged = true;
    std::size_t line_no = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        if (line_no < start || (bounded && line_no > stop)) {
            continue;
        }
        slice.content += line;
        if (!in.eof()) {
            slice.content.push_back('\n');
        }
        if (slice.first_line == 0) {
            slice.first_line = line_no;
        }
        slice.last_line = line_no;
        if (slice.content.size() > quota_.max_read_file_bytes) {
            return too_large(
                path, slice.content.size(), quota_.max_read_file_bytes,
                "slice_too_large",
                "Requested line range of " + path.string() + " exceeds the " +
                    describe_size(quota_.max_read_file_bytes) +
                    " read limit. Use a smaller limit.");
        }
    }
    if (in.bad()) {
        ToolError error{ErrorCategory::IOError,
                        "I/O error while reading file: " + path.string(),
                        "read_failed"};
        error.path = path.string();
        return error;
    }
    slice.total_lines = line_no;
    if (slice.first_line == 0) {
        // Nothing selected: report the requested start as an empty range.
        slice.first_line = start;
        slice.last_line = start - 1;
    }
    return slice;
}

core::errors::Result<BatchReadResult> ReadQuotaEnforcer::read_files(
    const std::vector<std::string>& paths) const {
    BatchReadResult result;
    result.requested = paths.size();

    std::size_t count = paths.size();
    if (count > quota_.max_batch_files) {
        count = quota_.max_batch_files;
        result.truncated = true;
        const std::string warning =
            "read_files: " + std::to_string(paths.size()) +
            " paths requested, only the first " +
            std::to_string(quota_.max_batch_files) + " were read (batch limit).";
        result.warnings.push_back(warning);
        sink_->emit(audit::EventKind::Warning, warning);
        LOG_WARN(warning);
    }

    result.entries.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        BatchEntry entry;
        entry.path = paths[i];

        auto inspected = inspect_regular_file(paths[i]);
        if (core::errors::is_error(inspected)) {
            entry.error = core::errors::get_error(inspected);
            result.entries.push_back(std::move(entry));
            continue;
        }

        const auto size = core::errors::get_value(inspected);
        if (size > quota_.max_batch_file_bytes) {
            entry.error = too_large(paths[i], size, quota_.max_batch_file_bytes,
                                    "batch_file_too_large",
                                    "file too large: " + describe_size(size) +
                                        " exceeds the " +
                                        describe_size(quota_.max_batch_file_bytes) +
                                        " per-file limit for batch reads.");
            result.entries.push_back(std::move(entry));
            continue;
        }

        auto content = read_whole(paths[i]);
        if (core::errors::is_error(content)) {
            entry.error = core::errors::get_error(content);
        } else {
            entry.content = core::errors::get_value(content);
        }
        result.entries.push_back(std::move(entry));
    }
    return result;
}

ListingResult ReadQuotaEnforcer::cap_results(std::vector<std::string> results,
                                             const std::string& what) const {
    ListingResult listing;
    listing.total_matches = results.size();
    if (results.size() > quota_.max_listing_results) {
        results.resize(quota_.max_listing_results);
        listing.truncated = true;
        const std::string warning =
            what + ": results truncated to " +
            std::to_string(quota_.max_listing_results) + " of " +
            std::to_string(listing.total_matches) + " (result limit " +
            std::to_string(quota_.max_listing_results) + ").";
        listing.warnings.push_back(warning);
        sink_->emit(audit::EventKind::Warning, warning);
        LOG_WARN(warning);
    }
    listing.paths = std::move(results);
    return listing;
}

core::errors::Result<ListingResult> ReadQuotaEnforcer::list_files(
    const std::string& pattern, const std::filesystem::path& workdir) const {
    auto expanded = expand_glob(pattern, workdir);
    if (core::errors::is_error(expanded)) {
        return core::errors::get_error(expanded);
    }
    return cap_results(core::errors::get_value(expanded), "list_files");
}

}  // namespace tollgate::quota
