#pragma once
#include "lxid/identity/identity_types.hpp"
#include <span>
namespace lxid::identity {
struct DerivedIdentity {
    PublicKey public_key{};
    IdentityHash identity_hash{};
    Address address{};

    [[nodiscard]] std::span<const uint8_t> X25519Public() const noexcept {
        return std::span<const uint8_t>(public_key).first<Constants::X_25519_PUBLIC_KEY_SIZE>();
    }
    [[nodiscard]] std::span<const uint8_t> Ed25519Public() const noexcept {
        return std::span<const uint8_t>(public_key).last<Constants::ED_25519_PUBLIC_KEY_SIZE>();
    }
    [[nodiscard]] bool operator==(const DerivedIdentity&) const = default;
};
}
