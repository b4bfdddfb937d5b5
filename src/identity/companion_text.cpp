#include "lxid/identity/companion_text.hpp"
#include "lxid/core/constants.hpp"
#include "lxid/encoding/base_encoding.hpp"
#include "lxid/encoding/hex.hpp"
#include <format>
namespace lxid::identity {
    using encoding::ToHex;

    std::string CompanionText::Render(const IdentitySecret& secret, const DerivedIdentity& derived) {
        std::string text;
        text += "LXMF Vanity Address Identity\n";
        text += "============================\n\n";
        text += std::format("{} {}\n", CompanionTextConstants::ADDRESS_MARKER, ToHex(derived.address));
        text += std::format("{}  {}\n\n", CompanionTextConstants::IDENTITY_HASH_MARKER, ToHex(derived.identity_hash));

        text += "Public Key (X25519 + Ed25519):\n";
        text += std::format("  X25519 Public:  {}\n", ToHex(derived.X25519Public()));
        text += std::format("  Ed25519 Public: {}\n\n", ToHex(derived.Ed25519Public()));

        text += "Private Key (X25519 + Ed25519):\n";
        text += std::format("  X25519 Private: {}\n", ToHex(secret.X25519Private()));
        text += std::format("  Ed25519 Seed:   {}\n\n", ToHex(secret.Ed25519Seed()));

        text += "--- Import formats ---\n";
        text += std::format("Base64 (MeshChat import string):\n{}\n", encoding::ToBase64(secret.AsBytes()));
        text += std::format("Base32 (Sideband import string):\n{}\n", encoding::ToBase32(secret.AsBytes()));
        return text;
    }

    CompanionTextCheck CompanionText::Check(std::string_view content, const IdentitySecret& secret) {
        CompanionTextCheck check;
        check.x25519_private_matches = ContainsHexOf(content, secret.X25519Private());
        check.ed25519_seed_matches = ContainsHexOf(content, secret.Ed25519Seed());

        size_t line_start = 0;
        while (line_start <= content.size()) {
            size_t line_end = content.find('\n', line_start);
            if (line_end == std::string_view::npos) {
                line_end = content.size();
            }
            std::string_view line = content.substr(line_start, line_end - line_start);
            if (line.starts_with(CompanionTextConstants::ADDRESS_MARKER)
                || line.starts_with(CompanionTextConstants::IDENTITY_HASH_MARKER)) {
                if (line.ends_with('\r')) {
                    line.remove_suffix(1);
                }
                check.echoed_lines.emplace_back(line);
            }
            line_start = line_end + 1;
        }
        return check;
    }

    bool CompanionText::ContainsHexOf(std::string_view content, std::span<const uint8_t> bytes) {
        return content.find(ToHex(bytes)) != std::string_view::npos;
    }
}
