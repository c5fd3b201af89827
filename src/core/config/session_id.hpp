#pragma once
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace tollgate::core::config {

    // "session-<unix seconds, hex>-<8 random hex>". Journal files are named
    // after it, so it must stay filesystem-safe.
    inline std::string generate_session_id() {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                                 std::chrono::system_clock::now().time_since_epoch())
                                 .count();

        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<std::uint32_t> dis;

        std::ostringstream ss;
        ss << "session-" << std::hex << seconds << "-"
           << std::setw(8) << std::setfill('0') << dis(gen);
        return ss.str();
    }

    inline bool is_valid_session_id(const std::string& id) {
        if (id.empty()) {
            return false;
        }
        for (const char c : id) {
            const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                            (c >= '0' && c <= '9') || c == '-' || c == '_';
            if (!ok) {
                return false;
            }
        }
        return true;
    }

} // namespace tollgate::core::config
