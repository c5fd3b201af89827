#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace tollgate::core::config {

// Name of the agent's own state directory (journal, databases).
inline constexpr const char* kStateDirName = ".tollgate";

// Trusted roles may write anywhere.
struct Unrestricted {};

// Allowlist of canonical paths. An empty set denies every write.
struct RestrictedTo {
    std::set<std::filesystem::path> paths;
};

using Ownership = std::variant<Unrestricted, RestrictedTo>;

struct PolicyConfig {
    Ownership ownership = Unrestricted{};
    std::set<std::filesystem::path> denied_files;
    bool deny_test_patterns = false;
    std::vector<std::string> protected_dirs = {kStateDirName};
};

// Absolute, symlink-resolved form of a path. Dangling symlinks resolve to
// their target; components that do not exist yet are kept lexically.
std::filesystem::path canonicalize(const std::filesystem::path& path);

// Builds a policy from orchestrator-supplied lists. An absent owned list means
// Unrestricted; a present one, even empty, means RestrictedTo.
PolicyConfig make_policy(
    const std::optional<std::vector<std::filesystem::path>>& owned_files,
    const std::optional<std::vector<std::filesystem::path>>& denied_files,
    bool deny_test_patterns);

}  // namespace tollgate::core::config
