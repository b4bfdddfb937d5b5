#pragma once

#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/identity/derived_identity.hpp"
#include "lxid/identity/destination_name.hpp"
#include "lxid/identity/identity_secret.hpp"

#include <span>

namespace lxid::identity {

/**
 * @brief Derives the public key, identity hash and destination address of an identity
 *
 * Derivation for a 64-byte secret (X25519 private || Ed25519 seed):
 * 1. public_key    = X25519(priv, base) || Ed25519Public(seed)
 * 2. identity_hash = SHA256(public_key)[0:16]
 * 3. name_hash     = SHA256(destination full name)[0:10]
 * 4. address       = SHA256(name_hash || identity_hash)[0:16]
 *
 * Pure: no randomness, no I/O. Key material is only length-checked; any
 * 32-byte string is a valid input for both curve operations.
 */
class AddressDeriver {
public:
    /**
     * @brief Derive for the "lxmf.delivery" destination from raw bytes
     *
     * Fails with InvalidLength before any hashing if the input is not 64 bytes.
     * Reads the halves in place; nothing is copied into secure memory.
     */
    [[nodiscard]] static Result<DerivedIdentity, IdentityFailure> Derive(
        std::span<const uint8_t> secret);

    [[nodiscard]] static Result<DerivedIdentity, IdentityFailure> Derive(
        const IdentitySecret& secret);

    [[nodiscard]] static Result<DerivedIdentity, IdentityFailure> Derive(
        const IdentitySecret& secret,
        const DestinationName& destination);

    [[nodiscard]] static Result<PublicKey, IdentityFailure> DerivePublicKey(
        const IdentitySecret& secret);

    [[nodiscard]] static IdentityHash ComputeIdentityHash(std::span<const uint8_t> public_key);

    [[nodiscard]] static Address ComputeDestinationHash(
        const NameHash& name_hash,
        const IdentityHash& identity_hash);

    /// Precomputed name hash of "lxmf.delivery".
    [[nodiscard]] static const NameHash& LxmfDeliveryNameHash();

private:
    [[nodiscard]] static Result<DerivedIdentity, IdentityFailure> DeriveWithNameHash(
        std::span<const uint8_t> x25519_private,
        std::span<const uint8_t> ed25519_seed,
        const NameHash& name_hash);

    [[nodiscard]] static Result<PublicKey, IdentityFailure> DerivePublicKey(
        std::span<const uint8_t> x25519_private,
        std::span<const uint8_t> ed25519_seed);

    AddressDeriver() = delete;
};

} // namespace lxid::identity
