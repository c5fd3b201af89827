#include "protocol/tool_catalog.hpp"

#include <utility>

namespace tollgate::protocol {

namespace {

using nlohmann::json;

json string_property(const std::string& description) {
    return json{{"type", "string"}, {"description", description}};
}

json integer_property(const std::string& description) {
    return json{{"type", "integer"}, {"description", description}};
}

json string_array_property(const std::string& description) {
    return json{{"type", "array"},
                {"items", json{{"type", "string"}}},
                {"description", description}};
}

json function(const std::string& name, const std::string& description,
              json properties, json required) {
    json parameters{{"type", "object"}, {"properties", std::move(properties)}};
    if (!required.empty()) {
        parameters["required"] = std::move(required);
    }
    return json{{"type", "function"},
                {"function",
                 json{{"name", name},
                      {"description", description},
                      {"parameters", std::move(parameters)}}}};
}

json core_definitions() {
    json defs = json::array();
    defs.push_back(function(
        "Read",
        "Read file content. Files above the read size limit must be read in "
        "line ranges: use Grep to find line numbers first, then Read with "
        "offset and limit.",
        json{{"file_path", string_property("Path to file")},
             {"offset", integer_property(
                            "Start reading from this line number (1-indexed). Optional.")},
             {"limit", integer_property("Maximum number of lines to return. Optional.")}},
        json::array({"file_path"})));
    defs.push_back(function(
        "Write", "Write content to file",
        json{{"file_path", string_property("Path to file")},
             {"content", string_property("Content to write")}},
        json::array({"file_path", "content"})));
    defs.push_back(function(
        "ReadFiles", "Read multiple files at once. Returns JSON dict of path->content.",
        json{{"file_paths", string_array_property("List of file paths to read")}},
        json::array({"file_paths"})));
    defs.push_back(function(
        "Edit",
        "Edit a file by replacing an exact string match. old_string must appear "
        "exactly once. Safer than Write for small changes.",
        json{{"file_path", string_property("Path to file")},
             {"old_string",
              string_property("Exact string to find and replace (must be unique in file)")},
             {"new_string", string_property("Replacement string")}},
        json::array({"file_path", "old_string", "new_string"})));
    defs.push_back(function(
        "Bash", "Run bash command",
        json{{"command", string_property("Command to run")},
             {"workdir", string_property("Working directory")}},
        json::array({"command"})));
    defs.push_back(function(
        "Glob", "List files matching pattern",
        json{{"pattern", string_property("Glob pattern")},
             {"workdir", string_property("Working directory")}},
        json::array({"pattern"})));
    defs.push_back(function(
        "Grep", "Search file contents for a regex pattern. Returns matching lines.",
        json{{"pattern", string_property("Regex pattern to search for")},
             {"path", string_property("Directory to search in (default .)")},
             {"include", string_property("File glob filter (e.g. '*.py')")}},
        json::array({"pattern"})));
    defs.push_back(function(
        "InstallPackage", "Install a package using the project's package manager",
        json{{"package_name", string_property("Name of package to install")}},
        json::array({"package_name"})));
    return defs;
}

}  // namespace

json ToolCatalog::ask_user_definition() {
    return function("AskUserQuestion", "Ask user a question",
                    json{{"question", string_property("The question to ask")},
                         {"options", string_array_property("Options")}},
                    json::array({"question"}));
}

json ToolCatalog::definitions(const bool interactive,
                              const std::optional<std::set<std::string>>& allowed) {
    json defs = core_definitions();
    if (interactive) {
        defs.push_back(ask_user_definition());
    }
    if (!allowed.has_value()) {
        return defs;
    }

    json filtered = json::array();
    for (auto& def : defs) {
        const auto name = def["function"]["name"].get<std::string>();
        if (allowed->count(name) > 0) {
            filtered.push_back(std::move(def));
        }
    }
    return filtered;
}

}  // namespace tollgate::protocol
