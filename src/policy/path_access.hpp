#pragma once

#include <filesystem>
#include <string>
#include "core/config/policy_config.hpp"
#include "core/errors/tool_errors.hpp"

namespace tollgate::policy {

// Decides whether a write or edit may touch a path. Every comparison uses the
// canonical form, so a symlink is judged by where it points.
class PathAccessController {
public:
    explicit PathAccessController(core::config::PolicyConfig policy = {});

    // Returns the canonical path on Permit, a PolicyDenied error otherwise.
    core::errors::Result<std::filesystem::path> check_write(
        const std::filesystem::path& path) const;

    static bool matches_test_pattern(const std::filesystem::path& canonical_path);

    const core::config::PolicyConfig& policy() const { return policy_; }

private:
    bool is_protected(const std::filesystem::path& path) const;

    core::config::PolicyConfig policy_;
};

}  // namespace tollgate::policy
