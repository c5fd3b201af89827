#include "quota/glob.hpp"

#include <algorithm>
#include <regex>
#include <set>
#include <string_view>
#include <system_error>

namespace tollgate::quota {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

constexpr std::size_t kMaxBraceExpansions = 64;

bool has_wildcard(const std::string& component) {
    return component.find_first_of("*?[{") != std::string::npos;
}

std::vector<std::string> split_components(const std::string& pattern) {
    std::vector<std::string> parts;
    std::string current;
    for (const char c : pattern) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) {
                parts.push_back(current);
            }
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

bool has_hidden_component(const std::filesystem::path& relative) {
    for (const auto& part : relative) {
        const std::string text = part.string();
        if (!text.empty() && text.front() == '.' && text != "." && text != "..") {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string glob_to_regex(const std::string& glob) {
    std::string out;
    out.reserve(glob.size() * 2);
    out += '^';
    for (std::size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];
        if (c == '*') {
            const bool is_double = (i + 1 < glob.size() && glob[i + 1] == '*');
            if (is_double) {
                const bool dir_form = (i + 2 < glob.size() && glob[i + 2] == '/');
                out += dir_form ? "(?:.*/)?" : ".*";
                i += dir_form ? 2 : 1;
            } else {
                out += "[^/]*";
            }
            continue;
        }
        if (c == '?') {
            out += "[^/]";
            continue;
        }
        if (c == '[') {
            const auto close = glob.find(']', i + 2);
            if (close != std::string::npos) {
                std::string body = glob.substr(i + 1, close - i - 1);
                if (!body.empty() && body.front() == '!') {
                    body.front() = '^';
                }
                out += '[';
                for (const char b : body) {
                    if (b == '\\') {
                        out += "\\\\";
                    } else {
                        out += b;
                    }
                }
                out += ']';
                i = close;
                continue;
            }
            out += "\\[";
            continue;
        }
        if (c == '\\' || c == '/') {
            out += '/';
            continue;
        }
        if (std::string_view(".()]{}+^$|").find(c) != std::string_view::npos) {
            out += '\\';
            out += c;
            continue;
        }
        out += c;
    }
    out += '$';
    return out;
}

std::vector<std::string> expand_braces(const std::string& pattern) {
    std::vector<std::string> pending = {pattern};
    std::vector<std::string> done;
    while (!pending.empty()) {
        std::string current = pending.back();
        pending.pop_back();

        const auto open = current.find('{');
        const auto close =
            current.find('}', open == std::string::npos ? 0 : open + 1);
        if (open == std::string::npos || close == std::string::npos ||
            close <= open + 1 || done.size() + pending.size() >= kMaxBraceExpansions) {
            done.push_back(current);
            continue;
        }

        const std::string inside = current.substr(open + 1, close - open - 1);
        std::size_t start = 0;
        while (start <= inside.size()) {
            std::size_t comma = inside.find(',', start);
            if (comma == std::string::npos) {
                comma = inside.size();
            }
            pending.push_back(current.substr(0, open) +
                              inside.substr(start, comma - start) +
                              current.substr(close + 1));
            start = comma + 1;
        }
    }
    std::reverse(done.begin(), done.end());
    return done;
}

core::errors::Result<std::vector<std::string>> expand_glob(
    const std::string& pattern, const std::filesystem::path& workdir) {
    if (pattern.empty()) {
        return ToolError{ErrorCategory::Input, "Glob pattern cannot be empty.",
                         "empty_glob_pattern"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workdir, ec) || ec) {
        ToolError error{ErrorCategory::NotFound,
                        "Working directory does not exist: " + workdir.string(),
                        "workdir_not_found"};
        error.path = workdir.string();
        return error;
    }
    const auto root = std::filesystem::absolute(workdir, ec).lexically_normal();

    std::set<std::string> matches;
    for (const auto& variant : expand_braces(pattern)) {
        const bool absolute = !variant.empty() && variant.front() == '/';
        const auto components = split_components(variant);

        // Longest wildcard-free directory prefix becomes the walk root.
        std::filesystem::path base = absolute ? std::filesystem::path("/") : root;
        std::size_t first_wild = 0;
        while (first_wild + 1 < components.size() &&
               !has_wildcard(components[first_wild])) {
            base /= components[first_wild];
            ++first_wild;
        }

        std::string rest;
        for (std::size_t i = first_wild; i < components.size(); ++i) {
            rest += (rest.empty() ? "" : "/") + components[i];
        }
        if (rest.empty()) {
            continue;
        }

        if (!has_wildcard(rest)) {
            const auto candidate = base / rest;
            if (std::filesystem::exists(candidate, ec) && !ec) {
                matches.insert(candidate.lexically_relative(root).generic_string());
            }
            continue;
        }

        std::regex matcher;
        try {
            matcher = std::regex(glob_to_regex(rest), std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return ToolError{ErrorCategory::Input,
                             "Invalid glob pattern '" + pattern + "': " + e.what(),
                             "invalid_glob_pattern"};
        }

        const bool recursive = rest.find("**") != std::string::npos;
        const int max_depth =
            static_cast<int>(std::count(rest.begin(), rest.end(), '/'));
        const bool include_hidden =
            rest.front() == '.' || rest.find("/.") != std::string::npos;

        if (!std::filesystem::is_directory(base, ec) || ec) {
            continue;
        }

        const auto options = std::filesystem::directory_options::skip_permission_denied;
        std::filesystem::recursive_directory_iterator it(base, options, ec);
        const std::filesystem::recursive_directory_iterator end;
        for (; !ec && it != end; it.increment(ec)) {
            const auto relative = it->path().lexically_relative(base);
            if (!include_hidden && has_hidden_component(relative)) {
                it.disable_recursion_pending();
                continue;
            }
            if (!recursive && it.depth() >= max_depth) {
                it.disable_recursion_pending();
            }
            if (std::regex_match(relative.generic_string(), matcher)) {
                matches.insert(it->path().lexically_relative(root).generic_string());
            }
        }
        ec.clear();
    }

    return std::vector<std::string>(matches.begin(), matches.end());
}

}  // namespace tollgate::quota
