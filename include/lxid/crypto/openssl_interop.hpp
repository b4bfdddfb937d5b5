#pragma once

#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/identity/identity_types.hpp"

#include <span>
#include <string>

namespace lxid::crypto {

/**
 * @brief OpenSSL EVP implementations of the primitives used for addressing
 *
 * Shares no code with SodiumInterop so that it can serve as an independent
 * reference when cross-checking derived addresses.
 */
class OpenSslInterop {
public:
    static Result<identity::X25519PublicKey, IdentityFailure> DeriveX25519PublicKey(
        std::span<const uint8_t> private_key);

    static Result<identity::Ed25519PublicKey, IdentityFailure> DeriveEd25519PublicKey(
        std::span<const uint8_t> seed);

    static Result<identity::Sha256Digest, IdentityFailure> Sha256(
        std::span<const uint8_t> data);

    /**
     * @brief Pops the most recent error off the OpenSSL error queue
     */
    static std::string LastError();

private:
    OpenSslInterop() = delete;
};

} // namespace lxid::crypto
