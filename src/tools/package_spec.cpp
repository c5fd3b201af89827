#include "tools/package_spec.hpp"

#include <regex>

namespace tollgate::tools {

namespace {

const std::regex& package_pattern() {
    static const std::regex pattern(R"(^[A-Za-z0-9._-]+[A-Za-z0-9._\-\[\],<>=!~ ]*$)");
    return pattern;
}

bool is_plain_word_char(const char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '@' || c == '%' || c == '+' || c == '=' || c == ':' ||
           c == ',' || c == '.' || c == '/' || c == '-';
}

std::string shell_escape_single_quotes(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 16);
    for (const char c : value) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped.push_back(c);
        }
    }
    return escaped;
}

}  // namespace

core::errors::Result<std::string> validate_package_spec(const std::string& spec) {
    // The pattern already excludes metacharacters; newlines are checked
    // separately because '$' may match before a trailing one.
    if (spec.find_first_of("\n\r") != std::string::npos ||
        !std::regex_match(spec, package_pattern())) {
        core::errors::ToolError error{core::errors::ErrorCategory::InvalidSpecifier,
                                      "invalid package name: '" + spec + "'",
                                      "invalid_package_name"};
        error.hint = "Use a plain package name with optional extras and version "
                     "constraints.";
        return error;
    }
    return spec;
}

std::string shell_quote(const std::string& value) {
    if (value.empty()) {
        return "''";
    }
    bool plain = true;
    for (const char c : value) {
        if (!is_plain_word_char(c)) {
            plain = false;
            break;
        }
    }
    return plain ? value : "'" + shell_escape_single_quotes(value) + "'";
}

}  // namespace tollgate::tools
