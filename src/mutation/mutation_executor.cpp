#include "mutation/mutation_executor.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <optional>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "mutation/unified_diff.hpp"

namespace tollgate::mutation {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

constexpr std::size_t kAuditMaxLines = 60;

ToolError io_error(const std::string& what, const std::filesystem::path& path,
                   const int err, const std::string& code) {
    ToolError error{ErrorCategory::IOError,
                    what + " " + path.string() + ": " + std::strerror(err), code};
    error.path = path.string();
    return error;
}

bool write_all(const int fd, const std::string& content) {
    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        const ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return true;
}

std::filesystem::path temp_path_for(const std::filesystem::path& target) {
    static std::atomic<unsigned long> counter{0};
    return target.parent_path() /
           ("." + target.filename().string() + ".tollgate-tmp." +
            std::to_string(::getpid()) + "." + std::to_string(counter++));
}

core::errors::Result<std::string> read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return io_error("Unable to open", path, errno, "open_failed");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return io_error("Unable to read", path, errno, "read_failed");
    }
    return buffer.str();
}

}  // namespace

std::size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return 0;
    }
    std::size_t count = 0;
    std::size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}

core::errors::Result<std::size_t> write_durably(const std::filesystem::path& path,
                                                const std::string& content) {
    std::error_code ec;
    const auto parent = path.parent_path();
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        ToolError error{ErrorCategory::IOError,
                        "Unable to create directory " + parent.string() + ": " +
                            ec.message(),
                        "mkdir_failed"};
        error.path = path.string();
        return error;
    }

    struct stat existing {};
    const bool had_file = ::stat(path.c_str(), &existing) == 0;
    if (had_file && S_ISDIR(existing.st_mode)) {
        return io_error("Cannot write file over directory", path, EISDIR, "is_directory");
    }

    const auto temp = temp_path_for(path);
    const int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
    if (fd < 0) {
        return io_error("Unable to create temporary file for", path, errno,
                        "temp_create_failed");
    }

    int failure = 0;
    std::string failed_step;
    if (had_file && ::fchmod(fd, existing.st_mode & 07777) != 0) {
        failure = errno;
        failed_step = "Unable to preserve mode of";
    } else if (!write_all(fd, content)) {
        failure = errno;
        failed_step = "Unable to write";
    } else if (::fsync(fd) != 0) {
        failure = errno;
        failed_step = "Unable to sync";
    }
    if (::close(fd) != 0 && failure == 0) {
        failure = errno;
        failed_step = "Unable to close";
    }
    if (failure == 0 && ::rename(temp.c_str(), path.c_str()) != 0) {
        failure = errno;
        failed_step = "Unable to replace";
    }
    if (failure != 0) {
        std::filesystem::remove(temp, ec);
        return io_error(failed_step, path, failure, "write_failed");
    }

    const int dir_fd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd < 0) {
        return io_error("Unable to open parent directory of", path, errno,
                        "dir_sync_failed");
    }
    // Some filesystems cannot fsync a directory; EINVAL means nothing to flush.
    const int dir_sync = ::fsync(dir_fd);
    const int dir_errno = errno;
    ::close(dir_fd);
    if (dir_sync != 0 && dir_errno != EINVAL) {
        return io_error("Unable to sync parent directory of", path, dir_errno,
                        "dir_sync_failed");
    }
    return content.size();
}

MutationExecutor::MutationExecutor(policy::PathAccessController access,
                                   std::shared_ptr<audit::EventSink> sink)
    : access_(std::move(access)), sink_(std::move(sink)) {
    if (!sink_) {
        sink_ = std::make_shared<audit::NullEventSink>();
    }
}

core::errors::Result<WriteOutcome> MutationExecutor::write(
    const std::filesystem::path& path, const std::string& content) const {
    auto permitted = access_.check_write(path);
    if (core::errors::is_error(permitted)) {
        return core::errors::get_error(permitted);
    }
    const std::filesystem::path target = core::errors::get_value(permitted);

    std::error_code ec;
    std::optional<std::string> previous;
    if (std::filesystem::is_regular_file(target, ec) && !ec) {
        auto old_content = read_text(target);
        if (core::errors::is_error(old_content)) {
            LOG_DEBUG("Unable to read previous content of " + target.string() + ": " +
                      core::errors::get_error(old_content).message);
        } else {
            previous = core::errors::get_value(old_content);
        }
    }

    sink_->emit(audit::EventKind::Write, "Writing " + std::to_string(content.size()) +
                                             " chars to " + target.string());
    auto written = write_durably(target, content);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    // A line diff can be empty when only the trailing newline changed; the
    // change is still reported as a patch.
    if (previous.has_value() && previous.value() != content) {
        sink_->emit_block(audit::EventKind::Diff, "PATCH " + path.string(),
                          unified_diff(previous.value(), content, path.string()),
                          kAuditMaxLines);
    } else {
        sink_->emit_block(audit::EventKind::Code,
                          "NEW " + path.string() + " (" +
                              std::to_string(content.size()) + " chars)",
                          content, kAuditMaxLines);
    }

    WriteOutcome outcome;
    outcome.path = target;
    outcome.created = !previous.has_value();
    outcome.bytes_written = core::errors::get_value(written);
    sink_->emit(audit::EventKind::FileChanged,
                "path=" + target.string() +
                    " action=" + (outcome.created ? "created" : "modified"));
    return outcome;
}

core::errors::Result<EditOutcome> MutationExecutor::edit(
    const std::filesystem::path& path, const std::string& old_string,
    const std::string& new_string) const {
    auto permitted = access_.check_write(path);
    if (core::errors::is_error(permitted)) {
        return core::errors::get_error(permitted);
    }
    const std::filesystem::path target = core::errors::get_value(permitted);

    std::error_code ec;
    if (!std::filesystem::exists(target, ec) || ec) {
        ToolError error{ErrorCategory::NotFound, "File not found: " + target.string(),
                        "file_not_found"};
        error.path = target.string();
        return error;
    }
    auto current = read_text(target);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    const std::string& content = core::errors::get_value(current);

    if (old_string.empty()) {
        return ToolError{ErrorCategory::Input, "old_string cannot be empty.",
                         "empty_old_string"};
    }

    const std::size_t count = count_occurrences(content, old_string);
    if (count == 0) {
        ToolError error{ErrorCategory::AmbiguousEdit,
                        "old_string not found in " + path.string(), "edit_not_found"};
        error.path = target.string();
        error.actual = 0;
        return error;
    }
    if (count > 1) {
        ToolError error{ErrorCategory::AmbiguousEdit,
                        "old_string found " + std::to_string(count) + " times in " +
                            path.string() + ".",
                        "edit_ambiguous"};
        error.path = target.string();
        error.actual = count;
        error.hint = "Provide more context to make it unique.";
        return error;
    }

    std::string updated = content;
    updated.replace(updated.find(old_string), old_string.size(), new_string);

    auto written = write_durably(target, updated);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    EditOutcome outcome;
    outcome.path = target;
    outcome.diff = unified_diff(content, updated, path.string());
    sink_->emit_block(audit::EventKind::Diff, "EDIT " + path.string(), outcome.diff,
                      kAuditMaxLines);
    sink_->emit(audit::EventKind::FileChanged,
                "path=" + target.string() + " action=edited");
    return outcome;
}

}  // namespace tollgate::mutation
