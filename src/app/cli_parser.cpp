#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace tollgate::app::cli {

    using namespace tollgate::core::errors;
    using tollgate::protocol::CallRequest;
    using tollgate::protocol::CliCommand;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> tool;
        std::optional<std::string> args;
        std::optional<std::string> cwd;
        std::optional<std::string> timeout_secs;
        std::vector<std::string> owned;
        std::vector<std::string> denied;
        std::vector<std::string> allowed;
        bool restrict_owned = false;
        bool deny_test_patterns = false;
        bool non_interactive = false;
        bool journal = false;
        std::optional<std::string> install_prefix;
        bool verbose = false;
    };

    namespace {

        std::filesystem::path anchor(const std::filesystem::path& base, const std::string& value) {
            const std::filesystem::path p(value);
            return p.is_absolute() ? p : base / p;
        }

    } // namespace

    Result<CallRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ToolError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: tollgate call --tool <name> [--args <json>]"};
        }

        std::string command = argv[1];
        if (command != "call" && command != "tools") {
            return ToolError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands are 'call' and 'tools'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const bool has_value = i + 1 < args.size();
            if (args[i] == "--tool") {
                if (has_value) raw.tool = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --tool", "missing_value"};
            } else if (args[i] == "--args") {
                if (has_value) raw.args = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --args", "missing_value"};
            } else if (args[i] == "--cwd") {
                if (has_value) raw.cwd = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --cwd", "missing_value"};
            } else if (args[i] == "--owned") {
                if (has_value) raw.owned.push_back(args[++i]);
                else return ToolError{ErrorCategory::Input, "Missing value for --owned", "missing_value"};
            } else if (args[i] == "--owned-none") {
                raw.restrict_owned = true;
            } else if (args[i] == "--denied") {
                if (has_value) raw.denied.push_back(args[++i]);
                else return ToolError{ErrorCategory::Input, "Missing value for --denied", "missing_value"};
            } else if (args[i] == "--allow") {
                if (has_value) raw.allowed.push_back(args[++i]);
                else return ToolError{ErrorCategory::Input, "Missing value for --allow", "missing_value"};
            } else if (args[i] == "--install-prefix") {
                if (has_value) raw.install_prefix = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --install-prefix", "missing_value"};
            } else if (args[i] == "--timeout-secs") {
                if (has_value) raw.timeout_secs = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --timeout-secs", "missing_value"};
            } else if (args[i] == "--deny-test-patterns") {
                raw.deny_test_patterns = true;
            } else if (args[i] == "--non-interactive") {
                raw.non_interactive = true;
            } else if (args[i] == "--journal") {
                raw.journal = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ToolError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CallRequest req;
        req.command = command == "call" ? CliCommand::Call : CliCommand::Tools;
        req.verbose = raw.verbose;
        req.interactive = !raw.non_interactive;
        req.journal = raw.journal;
        req.deny_test_patterns = raw.deny_test_patterns;

        if (req.command == CliCommand::Call) {
            if (!raw.tool.has_value() || raw.tool->empty()) {
                return ToolError{ErrorCategory::Input, "Must provide --tool", "missing_required_flag"};
            }
            req.tool_name = raw.tool.value();
            if (raw.args) req.arguments = raw.args.value();
        } else if (raw.tool.has_value() || raw.args.has_value()) {
            return ToolError{ErrorCategory::Input, "--tool and --args only apply to 'call'", "conflicting_flags"};
        }

        if (!raw.allowed.empty()) {
            req.allowed_tools = std::set<std::string>(raw.allowed.begin(), raw.allowed.end());
        }
        if (raw.install_prefix) req.install_prefix = raw.install_prefix.value();

        // Exception-free integer parsing
        if (raw.timeout_secs) {
            uint32_t secs = 0;
            const char* begin = raw.timeout_secs->data();
            const char* end = raw.timeout_secs->data() + raw.timeout_secs->size();
            auto [ptr, ec] = std::from_chars(begin, end, secs);
            if (ec != std::errc() || ptr != end) {
                return ToolError{ErrorCategory::Input, "Invalid number for --timeout-secs", "invalid_integer", "Provide a positive integer."};
            }
            if (secs == 0 || secs > 3600) {
                return ToolError{ErrorCategory::Input, "--timeout-secs out of bounds", "bounds_error", "Must be between 1 and 3600."};
            }
            req.timeout_secs = secs;
        }

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return ToolError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return ToolError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            req.working_directory = std::move(canonical_path);
        }

        // Ownership lists are relative to the working directory
        if (raw.restrict_owned || !raw.owned.empty()) {
            std::vector<std::filesystem::path> owned;
            for (const auto& value : raw.owned) {
                owned.push_back(anchor(req.working_directory, value));
            }
            req.owned_files = std::move(owned);
        }
        if (!raw.denied.empty()) {
            std::vector<std::filesystem::path> denied;
            for (const auto& value : raw.denied) {
                denied.push_back(anchor(req.working_directory, value));
            }
            req.denied_files = std::move(denied);
        }

        return req;
    }

} // namespace tollgate::app::cli
