#pragma once
#include "lxid/interfaces/i_reference_address_provider.hpp"
#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"
namespace lxid::verification {
/**
 * @brief Reference address computation on OpenSSL EVP
 *
 * Repeats the full derivation with OpenSSL's X25519, Ed25519 and SHA-256,
 * sharing nothing with the libsodium path in AddressDeriver. Any OpenSSL
 * failure makes the reference unavailable rather than failing the run.
 */
class OpenSslReferenceProvider final : public interfaces::IReferenceAddressProvider {
public:
    [[nodiscard]] std::string_view Name() const noexcept override;
    [[nodiscard]] Option<identity::Address> ComputeAddress(
        const identity::IdentitySecret& secret) override;

    /// Same computation with the failure reason preserved.
    [[nodiscard]] static Result<identity::Address, IdentityFailure> Compute(
        const identity::IdentitySecret& secret);
};
}
