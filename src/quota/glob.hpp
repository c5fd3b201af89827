#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"

namespace tollgate::quota {

// Translates one glob (no braces) to an anchored ECMAScript regex over
// '/'-separated relative paths. "**/" matches zero or more directories.
std::string glob_to_regex(const std::string& glob);

// "src/{a,b}.cpp" -> {"src/a.cpp", "src/b.cpp"}; one brace group per pass.
std::vector<std::string> expand_braces(const std::string& pattern);

// Expands pattern under workdir and returns matching paths relative to
// workdir, sorted and de-duplicated. Hidden entries only match when the
// pattern names a dot component explicitly.
core::errors::Result<std::vector<std::string>> expand_glob(
    const std::string& pattern, const std::filesystem::path& workdir);

}  // namespace tollgate::quota
