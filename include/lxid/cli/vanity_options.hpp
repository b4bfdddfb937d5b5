#pragma once
#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/configuration/vanity_config.hpp"
#include <ostream>
#include <span>
#include <string>
#include <string_view>
namespace lxid::cli {
/**
 * @brief Parses the vanity generator flags (program name excluded)
 *
 * Accepted forms: `--flag value`, `--flag=value` and the single-dash
 * variants. Flags:
 *   --prefix HEX       desired hex prefix (1-32 chars)
 *   --postfix HEX      desired hex postfix (1-32 chars)
 *   --workers N        number of worker threads (default: CPU count)
 *   --out PATH         output path for the identity file (default: identity)
 *   --dry-run          only measure speed, don't save
 *   --max-attempts N   give up after N attempts
 *
 * Unknown flags, missing or malformed values and invalid patterns are Usage
 * failures.
 */
[[nodiscard]] Result<configuration::VanityConfig, IdentityFailure> ParseVanityOptions(
    std::span<const std::string> args);

void PrintVanityUsage(std::ostream& out, std::string_view program);
}
