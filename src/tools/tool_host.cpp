#include "tools/tool_host.hpp"

#include <charconv>
#include <chrono>
#include <iostream>
#include <map>
#include <unistd.h>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "policy/command_guard.hpp"
#include "policy/path_access.hpp"
#include "tools/package_spec.hpp"

namespace tollgate::tools {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::ToolError;
using nlohmann::json;

namespace {

ToolError input_error(const std::string& message, const std::string& code) {
    return ToolError{ErrorCategory::Input, message, code};
}

Result<std::string> required_string(const json& args, const char* key) {
    const auto it = args.find(key);
    if (it == args.end()) {
        return input_error(std::string("Missing required argument: ") + key,
                           "missing_argument");
    }
    if (!it->is_string()) {
        return input_error(std::string("Argument must be a string: ") + key,
                           "invalid_argument");
    }
    return it->get<std::string>();
}

Result<std::string> optional_string(const json& args, const char* key,
                                    const std::string& fallback) {
    const auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        return input_error(std::string("Argument must be a string: ") + key,
                           "invalid_argument");
    }
    return it->get<std::string>();
}

Result<std::optional<std::size_t>> optional_count(const json& args, const char* key) {
    const auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return std::optional<std::size_t>{};
    }
    if (!it->is_number_integer() || it->get<long long>() < 0) {
        return input_error(std::string("Argument must be a non-negative integer: ") + key,
                           "invalid_argument");
    }
    return std::optional<std::size_t>{static_cast<std::size_t>(it->get<long long>())};
}

Result<std::vector<std::string>> string_list(const json& args, const char* key,
                                             const bool required) {
    const auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        if (required) {
            return input_error(std::string("Missing required argument: ") + key,
                               "missing_argument");
        }
        return std::vector<std::string>{};
    }
    if (!it->is_array()) {
        return input_error(std::string("Argument must be a list of strings: ") + key,
                           "invalid_argument");
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return input_error(std::string("Argument must be a list of strings: ") + key,
                               "invalid_argument");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

std::string render_listing(const quota::ListingResult& listing) {
    std::string out;
    for (const auto& path : listing.paths) {
        out += path + "\n";
    }
    for (const auto& warning : listing.warnings) {
        out += "Warning: " + warning + "\n";
    }
    return out;
}

// Unwraps each argument in turn; the first failure ends the call.
#define TOLLGATE_TRY_ASSIGN(var, expr)           \
    auto var##_result = (expr);                  \
    if (core::errors::is_error(var##_result)) {  \
        return core::errors::get_error(var##_result); \
    }                                            \
    const auto& var = core::errors::get_value(var##_result)

template <typename T, typename Render>
Result<std::string> render_result(const Result<T>& result, Render render) {
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return render(core::errors::get_value(result));
}

Result<std::string> invoke(const ToolHost& host, const std::string& tool, const json& args) {
    if (tool == "read_file") {
        TOLLGATE_TRY_ASSIGN(path, required_string(args, "file_path"));
        TOLLGATE_TRY_ASSIGN(offset, optional_count(args, "offset"));
        TOLLGATE_TRY_ASSIGN(limit, optional_count(args, "limit"));
        return render_result(host.read_file(path, offset, limit),
                             [](const quota::FileSlice& slice) { return slice.render(); });
    }
    if (tool == "write_file") {
        TOLLGATE_TRY_ASSIGN(path, required_string(args, "file_path"));
        TOLLGATE_TRY_ASSIGN(content, required_string(args, "content"));
        return render_result(host.write_file(path, content),
                             [&path](const mutation::WriteOutcome&) {
                                 return "Successfully wrote to " + path;
                             });
    }
    if (tool == "edit_file") {
        TOLLGATE_TRY_ASSIGN(path, required_string(args, "file_path"));
        TOLLGATE_TRY_ASSIGN(old_string, required_string(args, "old_string"));
        TOLLGATE_TRY_ASSIGN(new_string, required_string(args, "new_string"));
        return render_result(host.edit_file(path, old_string, new_string),
                             [&path](const mutation::EditOutcome&) {
                                 return "Successfully edited " + path;
                             });
    }
    if (tool == "read_files") {
        TOLLGATE_TRY_ASSIGN(paths, string_list(args, "file_paths", true));
        return render_result(host.read_files(paths),
                             [](const quota::BatchReadResult& batch) {
                                 return batch.to_json();
                             });
    }
    if (tool == "list_files") {
        TOLLGATE_TRY_ASSIGN(pattern, required_string(args, "pattern"));
        TOLLGATE_TRY_ASSIGN(workdir, optional_string(args, "workdir", "."));
        return render_result(host.list_files(pattern, workdir), render_listing);
    }
    if (tool == "grep_files") {
        TOLLGATE_TRY_ASSIGN(pattern, required_string(args, "pattern"));
        TOLLGATE_TRY_ASSIGN(path, optional_string(args, "path", "."));
        TOLLGATE_TRY_ASSIGN(include, optional_string(args, "include", "*"));
        return render_result(host.grep_files(pattern, path, include),
                             [](const SearchOutcome& search) { return search.render(); });
    }
    if (tool == "run_bash") {
        TOLLGATE_TRY_ASSIGN(command, required_string(args, "command"));
        TOLLGATE_TRY_ASSIGN(workdir, optional_string(args, "workdir", "."));
        return render_result(host.run_bash(command, workdir),
                             [](const process::CommandOutcome& outcome) {
                                 return outcome.render();
                             });
    }
    if (tool == "install_package") {
        TOLLGATE_TRY_ASSIGN(spec, required_string(args, "package_name"));
        return render_result(host.install_package(spec),
                             [](const process::CommandOutcome& outcome) {
                                 return outcome.render();
                             });
    }
    if (tool == "ask_user") {
        if (!host.session().interactive()) {
            return input_error("AskUserQuestion is not available in non-interactive mode.",
                               "tool_unavailable");
        }
        TOLLGATE_TRY_ASSIGN(question, required_string(args, "question"));
        TOLLGATE_TRY_ASSIGN(options, string_list(args, "options", false));
        return host.ask_user(question, options);
    }
    return input_error("Unknown tool: " + tool, "unknown_tool");
}

#undef TOLLGATE_TRY_ASSIGN

}  // namespace

std::string canonical_tool_name(const std::string& name) {
    static const std::map<std::string, std::string> kAliases = {
        {"Read", "read_file"},
        {"Write", "write_file"},
        {"Edit", "edit_file"},
        {"ReadFiles", "read_files"},
        {"Glob", "list_files"},
        {"Grep", "grep_files"},
        {"Bash", "run_bash"},
        {"InstallPackage", "install_package"},
        {"AskUserQuestion", "ask_user"},
    };
    const auto it = kAliases.find(name);
    return it == kAliases.end() ? name : it->second;
}

std::string SearchOutcome::render() const {
    std::string out;
    for (const auto& line : matches.paths) {
        out += line + "\n";
    }
    if (matches.paths.empty()) {
        out += "No matches found.\n";
    }
    for (const auto& warning : matches.warnings) {
        out += "Warning: " + warning + "\n";
    }
    if (!stderr_text.empty()) {
        out += "Stderr:\n" + stderr_text;
    }
    return out;
}

ToolHost::ToolHost(core::config::SessionContext session, core::config::PolicyConfig policy,
                   core::config::QuotaConfig quota, core::config::ExecutionLimits limits,
                   std::shared_ptr<audit::EventSink> sink,
                   std::shared_ptr<process::ProcessRunner> runner)
    : session_(std::move(session)),
      limits_(limits),
      sink_(sink ? std::move(sink) : std::make_shared<audit::NullEventSink>()),
      reader_(quota, sink_),
      mutator_(policy::PathAccessController(std::move(policy)), sink_),
      launcher_(policy::CommandGuard(), limits, std::move(runner), sink_) {}

Result<quota::FileSlice> ToolHost::read_file(const std::filesystem::path& path,
                                             std::optional<std::size_t> offset,
                                             std::optional<std::size_t> limit) const {
    sink_->emit(audit::EventKind::Read, path.string());
    return reader_.read_file(path, offset, limit);
}

Result<mutation::WriteOutcome> ToolHost::write_file(const std::filesystem::path& path,
                                                    const std::string& content) const {
    return mutator_.write(path, content);
}

Result<mutation::EditOutcome> ToolHost::edit_file(const std::filesystem::path& path,
                                                  const std::string& old_string,
                                                  const std::string& new_string) const {
    sink_->emit(audit::EventKind::Edit, path.string());
    return mutator_.edit(path, old_string, new_string);
}

Result<quota::BatchReadResult> ToolHost::read_files(
    const std::vector<std::string>& paths) const {
    sink_->emit(audit::EventKind::Read, std::to_string(paths.size()) + " files");
    return reader_.read_files(paths);
}

Result<quota::ListingResult> ToolHost::list_files(const std::string& pattern,
                                                  const std::filesystem::path& workdir) const {
    sink_->emit(audit::EventKind::Glob, pattern + " in " + workdir.string());
    return reader_.list_files(pattern, workdir);
}

Result<SearchOutcome> ToolHost::grep_files(const std::string& pattern,
                                           const std::filesystem::path& path,
                                           const std::string& include) const {
    if (pattern.empty()) {
        return input_error("Search pattern cannot be empty.", "empty_search_pattern");
    }
    sink_->emit(audit::EventKind::Grep, pattern + " in " + path.string());

    const std::vector<std::string> argv = {
        "grep", "-rn", "--include=" + (include.empty() ? std::string("*") : include),
        "-e", pattern, "--", path.string()};
    auto ran = launcher_.run_argv(argv, ".", limits_.search_timeout);
    if (core::errors::is_error(ran)) {
        return core::errors::get_error(ran);
    }
    const auto& outcome = core::errors::get_value(ran);
    if (outcome.exit_code > 1) {
        ToolError error{ErrorCategory::IOError,
                        "grep failed with exit code " + std::to_string(outcome.exit_code) +
                            ": " + outcome.stderr_text,
                        "search_failed"};
        error.path = path.string();
        return error;
    }

    SearchOutcome search;
    search.matches = reader_.cap_results(audit::split_lines(outcome.stdout_text), "grep_files");
    search.stderr_text = outcome.stderr_text;
    search.exit_code = outcome.exit_code;
    return search;
}

Result<process::CommandOutcome> ToolHost::run_bash(
    const std::string& command, const std::filesystem::path& workdir,
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    return launcher_.run(command, workdir, std::move(cancel_token));
}

Result<process::CommandOutcome> ToolHost::install_package(const std::string& spec) const {
    auto validated = validate_package_spec(spec);
    if (core::errors::is_error(validated)) {
        LOG_WARN(core::errors::get_error(validated).message);
        return core::errors::get_error(validated);
    }
    if (limits_.install_prefix.empty()) {
        return input_error("no install command configured. Cannot install '" + spec + "'.",
                           "install_not_configured");
    }
    const auto prefix_words = policy::split_shell_words(limits_.install_prefix);
    if (!prefix_words.has_value() || prefix_words->empty()) {
        return input_error("Install command is not a valid word list: " +
                               limits_.install_prefix,
                           "invalid_install_prefix");
    }

    std::string command;
    for (const auto& word : *prefix_words) {
        command += shell_quote(word) + " ";
    }
    command += shell_quote(core::errors::get_value(validated));
    sink_->emit(audit::EventKind::Package, spec);
    return run_bash(command, ".");
}

std::string ToolHost::ask_user(const std::string& question,
                               const std::vector<std::string>& options) const {
    const std::string fallback = options.empty() ? "yes" : options.front();
    if (!session_.interactive()) {
        sink_->emit(audit::EventKind::AutoAnswer, "Auto: " + question + " -> " + fallback);
        return fallback;
    }
    if (!isatty(STDIN_FILENO)) {
        sink_->emit(audit::EventKind::AutoAnswer,
                    "Auto (no tty): " + question + " -> " + fallback);
        return fallback;
    }

    sink_->emit(audit::EventKind::Question, question);
    if (options.empty()) {
        std::cerr << "Your answer: " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer) || answer.empty()) {
            return fallback;
        }
        return answer;
    }

    for (std::size_t i = 0; i < options.size(); ++i) {
        std::cerr << (i + 1) << ". " << options[i] << "\n";
    }
    std::cerr << "Enter choice number (default 1): " << std::flush;
    std::string choice;
    if (!std::getline(std::cin, choice)) {
        return fallback;
    }
    std::size_t index = 0;
    const char* begin = choice.data();
    const char* end = choice.data() + choice.size();
    const auto [ptr, ec] = std::from_chars(begin, end, index);
    if (ec != std::errc() || ptr != end || index == 0 || index > options.size()) {
        return fallback;
    }
    return options[index - 1];
}

protocol::ToolResult ToolHost::dispatch(const protocol::ToolCall& call) const {
    const auto started = std::chrono::steady_clock::now();
    protocol::ToolResult result;
    result.tool_call_id = call.id;

    const std::string tool = canonical_tool_name(call.name);
    Result<std::string> outcome = std::string();
    const json args = call.arguments.empty() ? json::object()
                                             : json::parse(call.arguments, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        outcome = input_error("Tool arguments must be a JSON object.", "invalid_arguments");
    } else {
        try {
            outcome = invoke(*this, tool, args);
        } catch (const json::exception& e) {
            outcome = input_error(std::string("Invalid tool arguments: ") + e.what(),
                                  "invalid_arguments");
        } catch (const std::exception& e) {
            LOG_ERROR("Tool " + tool + " failed unexpectedly: " + e.what());
            outcome = ToolError{ErrorCategory::Internal,
                                std::string("Unexpected failure: ") + e.what(),
                                "internal_error"};
        }
    }

    if (core::errors::is_error(outcome)) {
        const auto& error = core::errors::get_error(outcome);
        result.success = false;
        result.error_message = core::errors::render(error);
        result.error_code = error.code;
        result.error_category = core::errors::to_string(error.category);
        LOG_DEBUG("Tool " + tool + " failed [" + error.code + "]: " + error.message);
    } else {
        result.success = true;
        result.output = core::errors::get_value(outcome);
    }
    result.duration_ms = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - started)
                             .count();
    return result;
}

}  // namespace tollgate::tools
