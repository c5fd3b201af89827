#include "policy/command_guard.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include "core/config/policy_config.hpp"

namespace tollgate::policy {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase;

bool is_strictly_within(const std::filesystem::path& root,
                        const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end() && child_it != child.end();
}

bool is_operator_token(const std::string& token) {
    return token == ";" || token == "&" || token == "&&" || token == "|" ||
           token == "||" || token == "(" || token == ")";
}

bool is_rm_token(const std::string& token) {
    return token == "rm" ||
           (token.size() > 3 && token.compare(token.size() - 3, 3, "/rm") == 0);
}

// Anything that can move the shell (or a child) away from workdir before rm
// runs makes relative targets unresolvable.
bool changes_directory(const std::string& token) {
    return token == "cd" || token == "pushd" || token == "popd" || token == "-C" ||
           token.rfind("--chdir", 0) == 0;
}

}  // namespace

std::vector<CommandRule> default_command_rules() {
    return {
        {RuleKind::SafeOverride, R"(\bfind\b\s+.+-exec\s+rm\b)",
         "find -exec rm deletes only the matched file set"},
        {RuleKind::SafeOverride, R"(\bfind\b\s+.+-delete\b)",
         "find -delete removes only the matched entries"},

        {RuleKind::Blocked, R"(\brm\s+(?:-\S+\s+)*-[^\s-]*r[^\s]*f)",
         "recursive force delete (rm -rf)", true},
        {RuleKind::Blocked, R"(\brm\s+(?:-\S+\s+)*-[^\s-]*f[^\s]*r)",
         "recursive force delete (rm -fr)", true},
        {RuleKind::Blocked,
         R"(\brm\s+(?:-\S+\s+)*(?:-[^\s-]*r[^\s-]*\s+(?:-\S+\s+)*-[^\s-]*f|-[^\s-]*f[^\s-]*\s+(?:-\S+\s+)*-[^\s-]*r))",
         "recursive force delete (rm -r -f)", true},
        {RuleKind::Blocked, R"(\bmkfs\b)", "filesystem formatting (mkfs)"},
        {RuleKind::Blocked, R"(\bdd\s+)", "raw block copy (dd)"},
        {RuleKind::Blocked,
         R"(>\s*/dev/(?:sd[a-z]|hd[a-z]|vd[a-z]|xvd[a-z]|nvme\d|mmcblk\d|disk\d))",
         "redirection onto a block device"},
        {RuleKind::Blocked, R"(\bchmod\s+0?777\b)",
         "world-writable permission grant (chmod 777)"},
        {RuleKind::Blocked, R"(\bchmod\s+(?:-\S+\s+)*-[^\s-]*r[^\s]*\s+0?777\b)",
         "recursive world-writable permission grant (chmod -R 777)"},
        {RuleKind::Blocked, R"(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)",
         "fork bomb"},
        {RuleKind::Blocked, R"(\bcurl\b.*\|\s*(?:sudo\s+)?(?:ba|z|da)?sh\b)",
         "remote script piped to a shell (curl | sh)"},
        {RuleKind::Blocked, R"(\bwget\b.*\|\s*(?:sudo\s+)?(?:ba|z|da)?sh\b)",
         "remote script piped to a shell (wget | sh)"},
        {RuleKind::Blocked, R"(\bsqlite3\b.*\.tollgate/)",
         "direct access to the agent state database"},
        {RuleKind::Blocked, R"(>+\s*\S*\.tollgate(?:/|\s|$))",
         "redirection into the agent state directory"},
        {RuleKind::Blocked, R"(\b(?:tee|mv|cp|rm|truncate|ln)\b.*\.tollgate/)",
         "file operation on the agent state directory"},
    };
}

CommandGuard::CommandGuard() {
    auto compiled = from_policy(CommandPolicy{});
    // The built-in table is fixed and always compiles.
    *this = std::get<CommandGuard>(std::move(compiled));
}

CommandGuard::CommandGuard(std::vector<CompiledRule> compiled)
    : compiled_(std::move(compiled)) {
    rules_.reserve(compiled_.size());
    for (const auto& entry : compiled_) {
        rules_.push_back(entry.rule);
    }
}

core::errors::Result<CommandGuard> CommandGuard::from_policy(CommandPolicy policy) {
    // Overrides are moved ahead of every block rule so the single pass below
    // can never block a command an override covers, whatever the table order.
    std::stable_partition(policy.rules.begin(), policy.rules.end(),
                          [](const CommandRule& rule) {
                              return rule.kind == RuleKind::SafeOverride;
                          });

    std::vector<CompiledRule> compiled;
    compiled.reserve(policy.rules.size());
    for (auto& rule : policy.rules) {
        try {
            std::regex regex(rule.pattern, kRegexFlags);
            compiled.push_back(CompiledRule{std::move(rule), std::move(regex)});
        } catch (const std::regex_error& e) {
            return ToolError{ErrorCategory::Input,
                             "Invalid command rule pattern '" + rule.pattern +
                                 "': " + e.what(),
                             "invalid_command_rule"};
        }
    }
    return CommandGuard(std::move(compiled));
}

Verdict CommandGuard::evaluate(const std::string& command) const {
    return evaluate_rules(command, false);
}

Verdict CommandGuard::evaluate(const std::string& command,
                               const std::filesystem::path& workdir) const {
    return evaluate_rules(command, is_project_scoped_rm(command, workdir));
}

Verdict CommandGuard::evaluate_rules(const std::string& command,
                                     const bool scoped_delete) const {
    Verdict verdict;
    verdict.scoped_delete = scoped_delete;
    for (const auto& entry : compiled_) {
        if (entry.rule.kind == RuleKind::Blocked && scoped_delete &&
            entry.rule.waived_for_scoped_delete) {
            continue;
        }
        if (!std::regex_search(command, entry.regex)) {
            continue;
        }
        verdict.rule = entry.rule;
        verdict.decision = entry.rule.kind == RuleKind::SafeOverride
                               ? Decision::Allowed
                               : Decision::Blocked;
        return verdict;
    }
    return verdict;
}

bool CommandGuard::is_project_scoped_rm(const std::string& command,
                                        const std::filesystem::path& workdir) {
    static const std::regex recursive_rm(R"(\brm\s+-\S*r)", kRegexFlags);
    if (!std::regex_search(command, recursive_rm)) {
        return false;
    }

    const auto words = split_shell_words(command);
    if (!words.has_value()) {
        return false;
    }
    const auto& tokens = words.value();
    if (std::any_of(tokens.begin(), tokens.end(), changes_directory)) {
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workdir, ec) || ec) {
        return false;
    }
    const auto root = core::config::canonicalize(workdir);

    bool saw_rm = false;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (!is_rm_token(tokens[i])) {
            continue;
        }
        saw_rm = true;

        std::vector<std::string> targets;
        for (std::size_t j = i + 1; j < tokens.size(); ++j) {
            const auto& part = tokens[j];
            if (is_operator_token(part)) {
                break;
            }
            if (!part.empty() && part.front() == '-') {
                continue;
            }
            targets.push_back(part);
        }
        if (targets.empty()) {
            return false;
        }

        for (const auto& target : targets) {
            // Expansions cannot be resolved statically.
            if (target.empty() || target.front() == '~' ||
                target.find('$') != std::string::npos ||
                target.find('`') != std::string::npos) {
                return false;
            }
            const std::filesystem::path target_path(target);
            const auto resolved = core::config::canonicalize(
                target_path.is_absolute() ? target_path : root / target_path);
            if (!is_strictly_within(root, resolved)) {
                return false;
            }
        }
    }
    return saw_rm;
}

std::optional<std::vector<std::string>> split_shell_words(const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;

    auto flush = [&]() {
        if (in_word) {
            words.push_back(current);
            current.clear();
            in_word = false;
        }
    };

    for (std::size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];
        if (c == '\'') {
            const auto close = command.find('\'', i + 1);
            if (close == std::string::npos) {
                return std::nullopt;
            }
            current.append(command, i + 1, close - i - 1);
            in_word = true;
            i = close;
        } else if (c == '"') {
            std::size_t j = i + 1;
            for (; j < command.size() && command[j] != '"'; ++j) {
                if (command[j] == '\\' && j + 1 < command.size() &&
                    (command[j + 1] == '"' || command[j + 1] == '\\' ||
                     command[j + 1] == '$' || command[j + 1] == '`')) {
                    ++j;
                }
                current.push_back(command[j]);
            }
            if (j >= command.size()) {
                return std::nullopt;
            }
            in_word = true;
            i = j;
        } else if (c == '\\') {
            if (i + 1 < command.size()) {
                current.push_back(command[++i]);
                in_word = true;
            }
        } else if (c == ' ' || c == '\t' || c == '\n') {
            flush();
        } else if (c == ';' || c == '&' || c == '|' || c == '(' || c == ')') {
            flush();
            std::string op(1, c);
            if ((c == '&' || c == '|') && i + 1 < command.size() && command[i + 1] == c) {
                op.push_back(c);
                ++i;
            }
            words.push_back(op);
        } else {
            current.push_back(c);
            in_word = true;
        }
    }
    flush();
    return words;
}

}  // namespace tollgate::policy
