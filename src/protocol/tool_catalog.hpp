#pragma once

#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace tollgate::protocol {

// Function-calling schemas for the tool surface, in the
// {"type":"function","function":{name,description,parameters}} shape.
class ToolCatalog {
public:
    // AskUserQuestion is offered only to interactive sessions. When allowed is
    // present, only tools named in it are returned.
    static nlohmann::json definitions(
        bool interactive,
        const std::optional<std::set<std::string>>& allowed = std::nullopt);

    static nlohmann::json ask_user_definition();
};

}  // namespace tollgate::protocol
