#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tollgate::protocol {

    enum class CliCommand {
        Call,   // dispatch one tool call
        Tools   // print the tool catalog
    };

    // Represents the validated command-line input for one tollgate invocation
    struct CallRequest {
        CliCommand command = CliCommand::Call;
        std::string tool_name;
        std::string arguments = "{}";
        std::filesystem::path working_directory = std::filesystem::current_path();
        // Absent means unrestricted writes; present (even empty) is an allowlist.
        std::optional<std::vector<std::filesystem::path>> owned_files;
        std::optional<std::vector<std::filesystem::path>> denied_files;
        std::optional<std::set<std::string>> allowed_tools;
        bool deny_test_patterns = false;
        bool interactive = true;
        bool journal = false;
        std::string install_prefix;
        uint32_t timeout_secs = 120;
        bool verbose = false;
    };

} // namespace tollgate::protocol
