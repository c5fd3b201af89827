#include "policy/path_access.hpp"

#include <regex>
#include <system_error>
#include <utility>
#include <vector>

namespace tollgate::policy {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

const std::vector<std::regex>& test_file_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"((^|/)test_[^/]+$)"),           // test_foo.py
        std::regex(R"((^|/)[^/]+_test\.[^/]+$)"),    // foo_test.go
        std::regex(R"((^|/)[^/]+_spec\.[^/]+$)"),    // foo_spec.rb
        std::regex(R"((^|/)tests/)"),
        std::regex(R"((^|/)test/)"),
        std::regex(R"((^|/)spec/)"),
        std::regex(R"((^|/)__tests__/)"),
        std::regex(R"((^|/)conftest\.py$)"),
        std::regex(R"((^|/)[^/]+\.test\.[^/]+$)"),   // foo.test.ts
        std::regex(R"((^|/)Test[A-Z][^/]*\.java$)"),
    };
    return patterns;
}

}  // namespace

PathAccessController::PathAccessController(core::config::PolicyConfig policy)
    : policy_(std::move(policy)) {}

bool PathAccessController::matches_test_pattern(
    const std::filesystem::path& canonical_path) {
    const std::string text = canonical_path.generic_string();
    for (const auto& pattern : test_file_patterns()) {
        if (std::regex_search(text, pattern)) {
            return true;
        }
    }
    return false;
}

bool PathAccessController::is_protected(const std::filesystem::path& path) const {
    for (const auto& component : path) {
        for (const auto& dir : policy_.protected_dirs) {
            if (component == dir) {
                return true;
            }
        }
    }
    return false;
}

core::errors::Result<std::filesystem::path> PathAccessController::check_write(
    const std::filesystem::path& path) const {
    if (path.empty()) {
        return ToolError{ErrorCategory::Input, "Path cannot be empty.", "empty_path"};
    }

    std::error_code ec;
    auto literal = std::filesystem::absolute(path, ec);
    if (ec) {
        literal = path;
    }
    literal = literal.lexically_normal();
    const std::filesystem::path canonical = core::config::canonicalize(path);

    // Both forms are checked so neither a symlink into the state directory nor
    // a literal path through it slips past.
    if (is_protected(literal) || is_protected(canonical)) {
        ToolError error{ErrorCategory::PolicyDenied,
                        "Write to " + path.string() +
                            " denied: the path is inside the agent state directory.",
                        "internal_state_path"};
        error.path = canonical.string();
        error.hint = "Writing there would corrupt the running session.";
        return error;
    }

    if (policy_.denied_files.count(canonical) > 0) {
        ToolError error{ErrorCategory::PolicyDenied,
                        "Write to " + canonical.string() +
                            " denied: file is explicitly denied (read-only for this agent).",
                        "denied_file"};
        error.path = canonical.string();
        return error;
    }

    if (policy_.deny_test_patterns && matches_test_pattern(canonical)) {
        ToolError error{ErrorCategory::PolicyDenied,
                        "Write to " + canonical.string() +
                            " denied: path matches a test file pattern.",
                        "test_file_pattern"};
        error.path = canonical.string();
        error.hint = "Test files are read-only for this agent.";
        return error;
    }

    if (std::holds_alternative<core::config::Unrestricted>(policy_.ownership)) {
        return canonical;
    }

    const auto& owned = std::get<core::config::RestrictedTo>(policy_.ownership).paths;
    if (owned.count(canonical) > 0) {
        return canonical;
    }

    std::vector<std::string> permitted;
    permitted.reserve(owned.size());
    std::string listing;
    for (const auto& entry : owned) {
        permitted.push_back(entry.string());
        listing += (listing.empty() ? "" : ", ") + entry.string();
    }

    ToolError error{ErrorCategory::PolicyDenied,
                    "Write to " + canonical.string() +
                        " denied: file is not in the owned set. Permitted files: [" +
                        listing + "]",
                    "not_owned"};
    error.path = canonical.string();
    error.permitted = std::move(permitted);
    error.hint = "Write your changes into one of the permitted files instead.";
    return error;
}

}  // namespace tollgate::policy
