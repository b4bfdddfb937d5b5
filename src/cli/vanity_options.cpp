#include "lxid/cli/vanity_options.hpp"
#include "lxid/core/option.hpp"
#include "lxid/vanity/address_pattern.hpp"
#include <charconv>
#include <format>
namespace lxid::cli {
    namespace {
        using configuration::VanityConfig;

        struct FlagToken {
            std::string_view name;
            Option<std::string_view> inline_value;
        };

        Option<FlagToken> SplitFlag(std::string_view arg) {
            if (arg.size() < 2 || arg.front() != '-') {
                return None<FlagToken>();
            }
            arg.remove_prefix(arg.starts_with("--") ? 2 : 1);
            const auto equals = arg.find('=');
            if (equals == std::string_view::npos) {
                return FlagToken{arg, None<std::string_view>()};
            }
            return FlagToken{arg.substr(0, equals), Some(arg.substr(equals + 1))};
        }

        Result<uint64_t, IdentityFailure> ParseCount(std::string_view flag, std::string_view text) {
            uint64_t value = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || end != text.data() + text.size() || text.empty()) {
                return Result<uint64_t, IdentityFailure>::Err(
                    IdentityFailure::Usage(std::format("invalid value '{}' for --{}", text, flag)));
            }
            return Result<uint64_t, IdentityFailure>::Ok(value);
        }

        Result<bool, IdentityFailure> ParseBool(std::string_view flag, std::string_view text) {
            if (text == "true" || text == "1") {
                return Result<bool, IdentityFailure>::Ok(true);
            }
            if (text == "false" || text == "0") {
                return Result<bool, IdentityFailure>::Ok(false);
            }
            return Result<bool, IdentityFailure>::Err(
                IdentityFailure::Usage(std::format("invalid value '{}' for --{}", text, flag)));
        }
    }

    Result<VanityConfig, IdentityFailure> ParseVanityOptions(std::span<const std::string> args) {
        VanityConfig config;
        for (size_t i = 0; i < args.size(); ++i) {
            const auto token = SplitFlag(args[i]);
            if (!token.has_value()) {
                return Result<VanityConfig, IdentityFailure>::Err(
                    IdentityFailure::Usage(std::format("unexpected argument '{}'", args[i])));
            }
            const std::string_view name = token->name;

            if (name == "dry-run") {
                if (!token->inline_value.has_value()) {
                    config.dry_run = true;
                    continue;
                }
                auto flag_result = ParseBool(name, *token->inline_value);
                if (flag_result.IsErr()) {
                    return Result<VanityConfig, IdentityFailure>::Err(std::move(flag_result).UnwrapErr());
                }
                config.dry_run = flag_result.Unwrap();
                continue;
            }

            if (name != "prefix" && name != "postfix" && name != "workers"
                && name != "out" && name != "max-attempts") {
                return Result<VanityConfig, IdentityFailure>::Err(
                    IdentityFailure::Usage(std::format("flag provided but not defined: -{}", name)));
            }

            std::string_view value;
            if (token->inline_value.has_value()) {
                value = *token->inline_value;
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                return Result<VanityConfig, IdentityFailure>::Err(
                    IdentityFailure::Usage(std::format("flag needs an argument: -{}", name)));
            }

            if (name == "prefix") {
                config.prefix = std::string(value);
            } else if (name == "postfix") {
                config.postfix = std::string(value);
            } else if (name == "out") {
                if (value.empty()) {
                    return Result<VanityConfig, IdentityFailure>::Err(
                        IdentityFailure::Usage("output path cannot be empty"));
                }
                config.output_path = std::filesystem::path(std::string(value));
            } else {
                auto count_result = ParseCount(name, value);
                if (count_result.IsErr()) {
                    return Result<VanityConfig, IdentityFailure>::Err(std::move(count_result).UnwrapErr());
                }
                if (name == "workers") {
                    config.worker_count = static_cast<size_t>(count_result.Unwrap());
                } else {
                    config.max_attempts = count_result.Unwrap();
                }
            }
        }

        auto pattern_result = vanity::AddressPattern::Parse(config.prefix, config.postfix);
        if (pattern_result.IsErr()) {
            return Result<VanityConfig, IdentityFailure>::Err(
                IdentityFailure::Usage(pattern_result.UnwrapErr().message));
        }
        if (config.worker_count < 1) {
            return Result<VanityConfig, IdentityFailure>::Err(
                IdentityFailure::Usage("workers must be at least 1"));
        }
        return Result<VanityConfig, IdentityFailure>::Ok(std::move(config));
    }

    void PrintVanityUsage(std::ostream& out, std::string_view program) {
        out << std::format("Usage: {} [flags]\n", program);
        out << "  --prefix HEX       desired hex prefix (1-32 chars)\n";
        out << "  --postfix HEX      desired hex postfix/suffix (1-32 chars)\n";
        out << std::format("  --workers N        number of parallel workers (default {})\n",
            configuration::VanityConfig::DefaultWorkerCount());
        out << "  --out PATH         output path for identity file (default \"identity\")\n";
        out << "  --dry-run          only measure speed, don't save\n";
        out << "  --max-attempts N   give up after N attempts\n";
    }
}
