#pragma once

#include "lxid/core/constants.hpp"
#include "lxid/core/option.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>

namespace lxid::configuration {

/// Settings for a vanity address search
///
/// Patterns are hex strings matched against the 32-nibble address: `prefix`
/// from the first nibble, `postfix` ending at the last. At least one of them
/// must be non-empty (checked by vanity::AddressPattern::Parse).
struct VanityConfig {
    std::string prefix;
    std::string postfix;
    size_t worker_count = DefaultWorkerCount();
    std::filesystem::path output_path{std::string(VanityConstants::DEFAULT_OUTPUT_PATH)};
    bool dry_run = false;
    /// Stop without a result after this many attempts across all workers.
    Option<uint64_t> max_attempts;
    std::chrono::milliseconds progress_interval = VanityConstants::DEFAULT_PROGRESS_INTERVAL;

    [[nodiscard]] static size_t DefaultWorkerCount() noexcept {
        return std::max<size_t>(1, std::thread::hardware_concurrency());
    }
};

} // namespace lxid::configuration
