/**
 * @file verify_main.cpp
 * @brief lxid-verify: checks an identity file against the Reticulum identity format
 */

#include "lxid/cli/verify_options.hpp"
#include "lxid/core/constants.hpp"
#include "lxid/identity/identity_file.hpp"
#include "lxid/verification/identity_verifier.hpp"
#include "lxid/verification/openssl_reference_provider.hpp"
#include "lxid/verification/report_printer.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace lxid;
using namespace lxid::verification;

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "lxid-verify";
    const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto options_result = cli::ParseVerifyOptions(args);
    if (options_result.IsErr()) {
        std::cerr << options_result.UnwrapErr().message << std::endl;
        ReportPrinter::PrintUsage(std::cout, program);
        return ExitCodes::FAILURE;
    }
    const auto options = std::move(options_result).Unwrap();

    try {
        std::shared_ptr<interfaces::IReferenceAddressProvider> reference;
        if (options.config.IsReferenceCheckEnabled()) {
            reference = std::make_shared<OpenSslReferenceProvider>();
        }
        const IdentityVerifier verifier(options.config, std::move(reference));

        auto report_result = verifier.VerifyFile(options.identity_path);
        if (report_result.IsErr()) {
            ReportPrinter::PrintFailure(std::cout, options.identity_path, report_result.UnwrapErr(),
                identity::IdentityFile::FileSize(options.identity_path));
            return ExitCodes::FAILURE;
        }
        const auto& report = report_result.Unwrap();
        ReportPrinter::Print(std::cout, report);
        std::cout.flush();
        return report.ExitCode();
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return ExitCodes::FAILURE;
    }
}
