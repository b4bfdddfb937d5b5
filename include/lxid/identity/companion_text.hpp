#pragma once
#include "lxid/identity/derived_identity.hpp"
#include "lxid/identity/identity_secret.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace lxid::identity {
/// Outcome of comparing an identity against its human-readable dump.
struct CompanionTextCheck {
    bool x25519_private_matches = false;
    bool ed25519_seed_matches = false;
    /// Lines starting with "Address (LXMF):" or "Identity Hash:", in file order.
    std::vector<std::string> echoed_lines;

    [[nodiscard]] bool AllMatch() const noexcept {
        return x25519_private_matches && ed25519_seed_matches;
    }
};

class CompanionText {
public:
    /// Renders the dump written next to a saved identity file.
    [[nodiscard]] static std::string Render(
        const IdentitySecret& secret,
        const DerivedIdentity& derived);

    /// Substring search for the hex private key halves plus marker-line echo.
    [[nodiscard]] static CompanionTextCheck Check(
        std::string_view content,
        const IdentitySecret& secret);

    [[nodiscard]] static bool ContainsHexOf(
        std::string_view content,
        std::span<const uint8_t> bytes);
private:
    CompanionText() = delete;
};
}
