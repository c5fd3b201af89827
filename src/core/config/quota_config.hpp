#pragma once

#include <cstddef>
#include <cstdint>

namespace tollgate::core::config {

// Read-side thresholds. They apply uniformly regardless of caller identity.
struct QuotaConfig {
    std::uintmax_t max_read_file_bytes = 1024 * 1024;
    std::uintmax_t max_batch_file_bytes = 1024 * 1024;
    std::size_t max_batch_files = 100;
    std::size_t max_listing_results = 1000;
};

}  // namespace tollgate::core::config
