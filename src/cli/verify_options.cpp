#include "lxid/cli/verify_options.hpp"
#include "lxid/core/option.hpp"
#include <format>
namespace lxid::cli {
    Result<VerifyOptions, IdentityFailure> ParseVerifyOptions(std::span<const std::string> args) {
        VerifyOptions options;
        Option<std::filesystem::path> identity_path;
        for (const auto& arg : args) {
            if (arg == "--no-reference") {
                options.config = options.config.WithoutReferenceCheck();
            } else if (arg == "--no-companion") {
                options.config = options.config.WithoutCompanionText();
            } else if (arg.starts_with("-") && arg.size() > 1) {
                return Result<VerifyOptions, IdentityFailure>::Err(
                    IdentityFailure::Usage(std::format("Unknown option '{}'", arg)));
            } else if (identity_path.has_value()) {
                return Result<VerifyOptions, IdentityFailure>::Err(
                    IdentityFailure::Usage("Expected exactly one identity file"));
            } else {
                identity_path = std::filesystem::path(arg);
            }
        }
        if (!identity_path.has_value()) {
            return Result<VerifyOptions, IdentityFailure>::Err(
                IdentityFailure::Usage("Missing identity file argument"));
        }
        options.identity_path = std::move(*identity_path);
        return Result<VerifyOptions, IdentityFailure>::Ok(std::move(options));
    }
}
