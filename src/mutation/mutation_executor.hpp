#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include "audit/event_sink.hpp"
#include "core/errors/tool_errors.hpp"
#include "policy/path_access.hpp"

namespace tollgate::mutation {

struct WriteOutcome {
    std::filesystem::path path;  // canonical
    bool created = false;
    std::size_t bytes_written = 0;
};

struct EditOutcome {
    std::filesystem::path path;  // canonical
    std::string diff;
};

// Applies permitted writes and edits. Content reaches stable storage before a
// call returns: temp file, fsync, rename over the target, fsync the directory.
class MutationExecutor {
public:
    explicit MutationExecutor(policy::PathAccessController access,
                              std::shared_ptr<audit::EventSink> sink = nullptr);

    core::errors::Result<WriteOutcome> write(const std::filesystem::path& path,
                                             const std::string& content) const;

    core::errors::Result<EditOutcome> edit(const std::filesystem::path& path,
                                           const std::string& old_string,
                                           const std::string& new_string) const;

    const policy::PathAccessController& access() const { return access_; }

private:
    policy::PathAccessController access_;
    std::shared_ptr<audit::EventSink> sink_;
};

// Occurrences of needle in haystack, non-overlapping, scanning left to right.
std::size_t count_occurrences(const std::string& haystack, const std::string& needle);

core::errors::Result<std::size_t> write_durably(const std::filesystem::path& path,
                                                const std::string& content);

}  // namespace tollgate::mutation
