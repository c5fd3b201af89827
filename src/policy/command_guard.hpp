#pragma once

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"

namespace tollgate::policy {

enum class RuleKind {
    SafeOverride,
    Blocked
};

struct CommandRule {
    RuleKind kind;
    std::string pattern;
    std::string description;
    // Waived when every target of every rm in the command stays inside the workdir.
    bool waived_for_scoped_delete = false;
};

// Matching is case-insensitive regex search over the raw command text.
std::vector<CommandRule> default_command_rules();

struct CommandPolicy {
    std::vector<CommandRule> rules = default_command_rules();
};

enum class Decision {
    Allowed,
    Blocked
};

struct Verdict {
    Decision decision = Decision::Allowed;
    // The override or blocked rule that decided the verdict, if any.
    std::optional<CommandRule> rule;
    bool scoped_delete = false;

    bool allowed() const { return decision == Decision::Allowed; }
};

class CommandGuard {
public:
    // Compiles the built-in rule table.
    CommandGuard();

    static core::errors::Result<CommandGuard> from_policy(CommandPolicy policy);

    Verdict evaluate(const std::string& command) const;

    // Also recognizes recursive deletes confined to workdir.
    Verdict evaluate(const std::string& command,
                     const std::filesystem::path& workdir) const;

    static bool is_project_scoped_rm(const std::string& command,
                                     const std::filesystem::path& workdir);

    const std::vector<CommandRule>& rules() const { return rules_; }

private:
    struct CompiledRule {
        CommandRule rule;
        std::regex regex;
    };

    explicit CommandGuard(std::vector<CompiledRule> compiled);

    Verdict evaluate_rules(const std::string& command, bool scoped_delete) const;

    std::vector<CommandRule> rules_;
    std::vector<CompiledRule> compiled_;
};

// POSIX-shell style word splitting. Unquoted ; & | ( ) become separate
// operator tokens. Returns nullopt for unbalanced quotes.
std::optional<std::vector<std::string>> split_shell_words(const std::string& command);

}  // namespace tollgate::policy
