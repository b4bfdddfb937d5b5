#pragma once
#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/configuration/verifier_config.hpp"
#include <filesystem>
#include <span>
#include <string>
namespace lxid::cli {
struct VerifyOptions {
    std::filesystem::path identity_path;
    configuration::VerifierConfig config = configuration::VerifierConfig::Default();
};

/// Parses `[--no-reference] [--no-companion] <identity_file>` (program name
/// excluded). Anything else is a Usage failure.
[[nodiscard]] Result<VerifyOptions, IdentityFailure> ParseVerifyOptions(
    std::span<const std::string> args);
}
