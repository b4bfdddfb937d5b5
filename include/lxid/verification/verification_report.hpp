#pragma once
#include "lxid/core/option.hpp"
#include "lxid/identity/companion_text.hpp"
#include "lxid/identity/derived_identity.hpp"
#include "lxid/identity/identity_secret.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
namespace lxid::verification {
enum class VerificationOutcome : uint8_t {
    Match,
    Mismatch,
    ReferenceUnavailable
};

[[nodiscard]] std::string_view OutcomeName(VerificationOutcome outcome) noexcept;

struct CompanionResult {
    std::filesystem::path path;
    identity::CompanionTextCheck check;
};

struct VerificationReport {
    std::filesystem::path identity_path;
    size_t file_size = 0;
    identity::IdentitySecret secret;
    identity::DerivedIdentity derived;
    /// None when the companion check is disabled or no companion file exists.
    Option<CompanionResult> companion;
    /// Empty when no reference implementation is configured.
    std::string reference_name;
    Option<identity::Address> reference_address;
    VerificationOutcome outcome = VerificationOutcome::ReferenceUnavailable;

    /// 1 only for a reference mismatch; degraded runs still succeed.
    [[nodiscard]] int ExitCode() const noexcept;
};
}
