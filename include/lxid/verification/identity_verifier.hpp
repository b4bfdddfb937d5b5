#pragma once

#include "lxid/core/result.hpp"
#include "lxid/core/option.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/configuration/verifier_config.hpp"
#include "lxid/interfaces/i_reference_address_provider.hpp"
#include "lxid/verification/verification_report.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace lxid::verification {

/**
 * @brief Checks an identity file for compatibility with the Reticulum format
 *
 * Steps, stopping at the first error:
 * 1. Read the 64-byte identity (missing file / wrong size are errors)
 * 2. Compare against the companion text if enabled and present
 * 3. Derive public keys, identity hash and LXMF address locally
 * 4. Ask the reference provider (if any) for the address and compare
 *
 * A missing or failing reference provider is not an error: the report ends
 * as ReferenceUnavailable.
 */
class IdentityVerifier {
public:
    /**
     * @param config Enabled checks
     * @param reference Independent implementation; may be null
     */
    IdentityVerifier(
        configuration::VerifierConfig config,
        std::shared_ptr<interfaces::IReferenceAddressProvider> reference);

    [[nodiscard]] Result<VerificationReport, IdentityFailure> VerifyFile(
        const std::filesystem::path& path) const;

    /**
     * @brief Verify an in-memory identity
     *
     * @param companion_content Companion text content, if there is one
     */
    [[nodiscard]] Result<VerificationReport, IdentityFailure> VerifySecret(
        identity::IdentitySecret secret,
        const Option<std::string>& companion_content) const;

    [[nodiscard]] static VerificationOutcome Compare(
        const identity::Address& computed,
        const Option<identity::Address>& reference);

private:
    [[nodiscard]] Result<VerificationReport, IdentityFailure> Verify(
        std::filesystem::path identity_path,
        size_t file_size,
        identity::IdentitySecret secret,
        const Option<std::string>& companion_content,
        std::filesystem::path companion_path) const;

    configuration::VerifierConfig config_;
    std::shared_ptr<interfaces::IReferenceAddressProvider> reference_;
};

} // namespace lxid::verification
