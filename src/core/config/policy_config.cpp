#include "core/config/policy_config.hpp"

#include <system_error>

namespace tollgate::core::config {

namespace {

constexpr int kMaxSymlinkHops = 40;

}  // namespace

std::filesystem::path canonicalize(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path current = std::filesystem::absolute(path, ec);
    if (ec) {
        current = path;
    }

    // weakly_canonical treats a dangling link as a missing component, which
    // would let a write land on the link target unnoticed.
    for (int hop = 0; hop < kMaxSymlinkHops; ++hop) {
        const auto status = std::filesystem::symlink_status(current, ec);
        if (ec || !std::filesystem::is_symlink(status)) {
            break;
        }
        const auto target = std::filesystem::read_symlink(current, ec);
        if (ec) {
            break;
        }
        current = target.is_absolute() ? target : current.parent_path() / target;
    }

    auto resolved = std::filesystem::weakly_canonical(current, ec);
    if (ec) {
        return current.lexically_normal();
    }
    return resolved;
}

PolicyConfig make_policy(
    const std::optional<std::vector<std::filesystem::path>>& owned_files,
    const std::optional<std::vector<std::filesystem::path>>& denied_files,
    const bool deny_test_patterns) {
    PolicyConfig policy;
    if (owned_files.has_value()) {
        RestrictedTo restricted;
        for (const auto& path : owned_files.value()) {
            restricted.paths.insert(canonicalize(path));
        }
        policy.ownership = std::move(restricted);
    }
    if (denied_files.has_value()) {
        for (const auto& path : denied_files.value()) {
            policy.denied_files.insert(canonicalize(path));
        }
    }
    policy.deny_test_patterns = deny_test_patterns;
    return policy;
}

}  // namespace tollgate::core::config
