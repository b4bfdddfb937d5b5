#include "lxid/verification/identity_verifier.hpp"
#include "lxid/identity/address_deriver.hpp"
#include "lxid/identity/identity_file.hpp"
#include "lxid/debug/key_logger.hpp"
#include <string>

namespace lxid::verification {
    using identity::AddressDeriver;
    using identity::CompanionText;
    using identity::IdentityFile;
    using identity::IdentitySecret;

    IdentityVerifier::IdentityVerifier(
        configuration::VerifierConfig config,
        std::shared_ptr<interfaces::IReferenceAddressProvider> reference)
        : config_(config)
        , reference_(std::move(reference)) {
    }

    Result<VerificationReport, IdentityFailure> IdentityVerifier::VerifyFile(
        const std::filesystem::path& path) const {
        auto load_result = IdentityFile::Read(path);
        if (load_result.IsErr()) {
            return Result<VerificationReport, IdentityFailure>::Err(
                std::move(load_result).UnwrapErr());
        }
        auto loaded = std::move(load_result).Unwrap();

        Option<std::string> companion_content;
        std::filesystem::path companion_path;
        if (config_.IsCompanionCheckEnabled()) {
            companion_path = IdentityFile::CompanionPath(path, config_.CompanionSuffix());
            auto text_result = IdentityFile::ReadCompanionText(path, config_.CompanionSuffix());
            if (text_result.IsErr()) {
                return Result<VerificationReport, IdentityFailure>::Err(
                    std::move(text_result).UnwrapErr());
            }
            companion_content = std::move(text_result).Unwrap();
        }

        return Verify(path, loaded.file_size, std::move(loaded.secret),
            companion_content, std::move(companion_path));
    }

    Result<VerificationReport, IdentityFailure> IdentityVerifier::VerifySecret(
        IdentitySecret secret,
        const Option<std::string>& companion_content) const {
        const auto file_size = secret.AsBytes().size();
        return Verify({}, file_size, std::move(secret), companion_content, {});
    }

    VerificationOutcome IdentityVerifier::Compare(
        const identity::Address& computed,
        const Option<identity::Address>& reference) {
        if (!reference.has_value()) {
            return VerificationOutcome::ReferenceUnavailable;
        }
        return *reference == computed ? VerificationOutcome::Match : VerificationOutcome::Mismatch;
    }

    Result<VerificationReport, IdentityFailure> IdentityVerifier::Verify(
        std::filesystem::path identity_path,
        const size_t file_size,
        IdentitySecret secret,
        const Option<std::string>& companion_content,
        std::filesystem::path companion_path) const {
        auto derive_result = AddressDeriver::Derive(secret);
        if (derive_result.IsErr()) {
            return Result<VerificationReport, IdentityFailure>::Err(
                std::move(derive_result).UnwrapErr());
        }

        Option<CompanionResult> companion;
        if (config_.IsCompanionCheckEnabled() && companion_content.has_value()) {
            companion = CompanionResult{
                std::move(companion_path),
                CompanionText::Check(*companion_content, secret)
            };
        }

        std::string reference_name;
        Option<identity::Address> reference_address;
        if (config_.IsReferenceCheckEnabled() && reference_) {
            reference_name = std::string(reference_->Name());
            reference_address = reference_->ComputeAddress(secret);
            if (!reference_address.has_value()) {
                LXID_LOG_MSG("VERIFY", "reference implementation returned no address");
            }
        }

        const auto outcome = Compare(derive_result.Unwrap().address, reference_address);
        LXID_LOG_MSG("VERIFY", std::string(OutcomeName(outcome)).c_str());
        return Result<VerificationReport, IdentityFailure>::Ok(VerificationReport{
            .identity_path = std::move(identity_path),
            .file_size = file_size,
            .secret = std::move(secret),
            .derived = derive_result.Unwrap(),
            .companion = std::move(companion),
            .reference_name = std::move(reference_name),
            .reference_address = reference_address,
            .outcome = outcome
        });
    }
}
