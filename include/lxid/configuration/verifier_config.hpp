#pragma once

#include "lxid/core/constants.hpp"

#include <string_view>

namespace lxid::configuration {

/// Which optional checks the identity verifier performs
///
/// The self-computed address is always derived and reported. The two
/// optional layers are:
/// - Reference check: recompute the address with an independent
///   implementation and compare byte-for-byte
/// - Companion check: look for the private key halves in "<identity>.txt"
///
/// @example
/// ```cpp
/// auto config = VerifierConfig::Default();              // everything
/// auto offline = VerifierConfig::SelfCheckOnly();       // no reference
/// auto bare = VerifierConfig::Default().WithoutCompanionText();
/// ```
class VerifierConfig {
public:
    /// Reference cross-check and companion text check enabled
    [[nodiscard]] static constexpr VerifierConfig Default() noexcept {
        return VerifierConfig(true, true);
    }

    /// Only the self-computed derivation plus companion text.
    /// A run with this config always ends as "reference unavailable".
    [[nodiscard]] static constexpr VerifierConfig SelfCheckOnly() noexcept {
        return VerifierConfig(false, true);
    }

    [[nodiscard]] constexpr VerifierConfig WithoutCompanionText() const noexcept {
        return VerifierConfig(reference_check_, false);
    }

    [[nodiscard]] constexpr VerifierConfig WithoutReferenceCheck() const noexcept {
        return VerifierConfig(false, companion_check_);
    }

    [[nodiscard]] constexpr bool IsReferenceCheckEnabled() const noexcept {
        return reference_check_;
    }

    [[nodiscard]] constexpr bool IsCompanionCheckEnabled() const noexcept {
        return companion_check_;
    }

    /// Suffix appended to the identity path to locate the companion text
    [[nodiscard]] constexpr std::string_view CompanionSuffix() const noexcept {
        return CompanionTextConstants::FILE_SUFFIX;
    }

    [[nodiscard]] constexpr bool operator==(const VerifierConfig& other) const noexcept {
        return reference_check_ == other.reference_check_
            && companion_check_ == other.companion_check_;
    }

private:
    constexpr VerifierConfig(const bool reference_check, const bool companion_check) noexcept
        : reference_check_(reference_check)
        , companion_check_(companion_check) {}

    bool reference_check_;
    bool companion_check_;
};

} // namespace lxid::configuration
