#pragma once

#include <cstddef>
#include <string>

namespace tollgate::mutation {

// Line-based unified diff with `context` lines around each hunk, headed by
// "--- a/<label>" and "+++ b/<label>". Returns an empty string when the
// texts are equal.
std::string unified_diff(const std::string& old_text, const std::string& new_text,
                         const std::string& label, std::size_t context = 3);

}  // namespace tollgate::mutation
