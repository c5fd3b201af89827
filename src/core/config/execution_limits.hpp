#pragma once

#include <chrono>
#include <string>

namespace tollgate::core::config {

struct ExecutionLimits {
    std::chrono::milliseconds command_timeout{120 * 1000};
    std::chrono::milliseconds search_timeout{60 * 1000};
    // Package manager invocation, e.g. "pip install". Empty disables install_package.
    std::string install_prefix;
};

}  // namespace tollgate::core::config
