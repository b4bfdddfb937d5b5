/**
 * @file vanity_main.cpp
 * @brief lxid-vanity: searches for an identity whose LXMF address has a given prefix/postfix
 */

#include "lxid/cli/vanity_options.hpp"
#include "lxid/core/constants.hpp"
#include "lxid/encoding/hex.hpp"
#include "lxid/identity/identity_file.hpp"
#include "lxid/vanity/address_pattern.hpp"
#include "lxid/vanity/progress_monitor.hpp"
#include "lxid/vanity/vanity_search.hpp"

#include <exception>
#include <format>
#include <iostream>
#include <string>
#include <vector>

using namespace lxid;
using namespace lxid::vanity;

namespace {

void PrintSearchHeader(const configuration::VanityConfig& config, const AddressPattern& pattern) {
    std::cout << "Searching for LXMF vanity address...\n";
    if (!pattern.Prefix().empty()) {
        std::cout << std::format("  Prefix:  {}\n", pattern.Prefix());
    }
    if (!pattern.Postfix().empty()) {
        std::cout << std::format("  Postfix: {}\n", pattern.Postfix());
    }
    std::cout << std::format("  Workers: {}\n", config.worker_count);
    if (config.max_attempts.has_value()) {
        std::cout << std::format("  Limit:   {} attempts\n", *config.max_attempts);
    }
    if (config.dry_run) {
        std::cout << "  Mode:    DRY RUN (speed test only)\n";
    }
    std::cout << std::endl;
}

int RunSearch(const configuration::VanityConfig& config) {
    auto pattern_result = AddressPattern::Parse(config.prefix, config.postfix);
    if (pattern_result.IsErr()) {
        std::cerr << "Error: " << pattern_result.UnwrapErr().message << std::endl;
        return ExitCodes::FAILURE;
    }
    auto pattern = std::move(pattern_result).Unwrap();
    PrintSearchHeader(config, pattern);

    VanitySearch search(std::move(pattern), config.worker_count, config.max_attempts);
    ProgressMonitor monitor(search.AttemptCounter(), config.progress_interval,
        [](const ProgressSample& sample) {
            std::cout << ProgressMonitor::FormatSample(sample) << std::flush;
        });

    monitor.Start();
    auto search_result = search.Run();
    monitor.Stop();

    if (search_result.IsErr()) {
        std::cerr << "\nError: " << search_result.UnwrapErr().message << std::endl;
        return ExitCodes::FAILURE;
    }
    auto found = std::move(search_result).Unwrap();
    if (!found.has_value()) {
        std::cout << std::format("\n✗ No matching address after {} attempts\n", search.Attempts());
        return ExitCodes::FAILURE;
    }

    std::cout << std::format("\n✓ Found matching address: {}\n", encoding::ToHex(found->derived.address));
    std::cout << std::format("  Total attempts: {}\n", found->attempts);

    if (!config.dry_run) {
        auto save_result = identity::IdentityFile::Save(config.output_path, found->secret, found->derived);
        if (save_result.IsErr()) {
            std::cerr << "Error saving identity: " << save_result.UnwrapErr().message << std::endl;
            return ExitCodes::FAILURE;
        }
        std::cout << std::format("  Saved to: {}\n", config.output_path.string());
    }
    return ExitCodes::SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "lxid-vanity";
    const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto config_result = cli::ParseVanityOptions(args);
    if (config_result.IsErr()) {
        std::cerr << "Error: " << config_result.UnwrapErr().message << std::endl;
        cli::PrintVanityUsage(std::cerr, program);
        return ExitCodes::FAILURE;
    }

    try {
        return RunSearch(config_result.Unwrap());
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return ExitCodes::FAILURE;
    }
}
