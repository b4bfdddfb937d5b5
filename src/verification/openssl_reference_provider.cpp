#include "lxid/verification/openssl_reference_provider.hpp"
#include "lxid/crypto/openssl_interop.hpp"
#include "lxid/core/constants.hpp"
#include "lxid/debug/key_logger.hpp"
#include <algorithm>
namespace lxid::verification {
    using crypto::OpenSslInterop;
    using identity::Address;

    std::string_view OpenSslReferenceProvider::Name() const noexcept {
        return "OpenSSL EVP";
    }

    Option<Address> OpenSslReferenceProvider::ComputeAddress(const identity::IdentitySecret& secret) {
        return Compute(secret).ToOption();
    }

    Result<Address, IdentityFailure> OpenSslReferenceProvider::Compute(const identity::IdentitySecret& secret) {
        auto x25519_result = OpenSslInterop::DeriveX25519PublicKey(secret.X25519Private());
        if (x25519_result.IsErr()) {
            return Result<Address, IdentityFailure>::Err(std::move(x25519_result).UnwrapErr());
        }
        auto ed25519_result = OpenSslInterop::DeriveEd25519PublicKey(secret.Ed25519Seed());
        if (ed25519_result.IsErr()) {
            return Result<Address, IdentityFailure>::Err(std::move(ed25519_result).UnwrapErr());
        }
        identity::PublicKey public_key{};
        const auto& x25519_public = x25519_result.Unwrap();
        const auto& ed25519_public = ed25519_result.Unwrap();
        std::copy(ed25519_public.begin(), ed25519_public.end(),
            std::copy(x25519_public.begin(), x25519_public.end(), public_key.begin()));

        auto identity_digest = OpenSslInterop::Sha256(public_key);
        if (identity_digest.IsErr()) {
            return Result<Address, IdentityFailure>::Err(std::move(identity_digest).UnwrapErr());
        }
        const auto& full_name = DestinationConstants::LXMF_DELIVERY_NAME;
        auto name_digest = OpenSslInterop::Sha256(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(full_name.data()), full_name.size()));
        if (name_digest.IsErr()) {
            return Result<Address, IdentityFailure>::Err(std::move(name_digest).UnwrapErr());
        }

        std::array<uint8_t, Constants::NAME_HASH_SIZE + Constants::IDENTITY_HASH_SIZE> material{};
        const auto& name_hash = name_digest.Unwrap();
        const auto& identity_hash = identity_digest.Unwrap();
        auto out = std::copy_n(name_hash.begin(), Constants::NAME_HASH_SIZE, material.begin());
        std::copy_n(identity_hash.begin(), Constants::IDENTITY_HASH_SIZE, out);

        auto address_digest = OpenSslInterop::Sha256(material);
        if (address_digest.IsErr()) {
            return Result<Address, IdentityFailure>::Err(std::move(address_digest).UnwrapErr());
        }
        Address address{};
        std::copy_n(address_digest.Unwrap().begin(), address.size(), address.begin());

        debug::LogAddressDerivation("OPENSSL REFERENCE DERIVATION",
            secret.X25519Private(), secret.Ed25519Seed(), public_key,
            std::span<const uint8_t>(identity_hash).first(Constants::IDENTITY_HASH_SIZE),
            std::span<const uint8_t>(name_hash).first(Constants::NAME_HASH_SIZE),
            address);

        return Result<Address, IdentityFailure>::Ok(address);
    }
}
