#include "lxid/identity/address_deriver.hpp"
#include "lxid/crypto/sodium_interop.hpp"
#include "lxid/debug/key_logger.hpp"
#include <algorithm>
#include <format>

namespace lxid::identity {
    using crypto::SodiumInterop;

    Result<DerivedIdentity, IdentityFailure> AddressDeriver::Derive(std::span<const uint8_t> secret) {
        if (secret.size() != Constants::IDENTITY_SECRET_SIZE) {
            return Result<DerivedIdentity, IdentityFailure>::Err(
                IdentityFailure::InvalidLength(
                    std::format("Identity secret must be {} bytes, got {}",
                        Constants::IDENTITY_SECRET_SIZE, secret.size())));
        }
        return SodiumInterop::Initialize()
            .MapErr(IdentityFailure::FromSodiumFailure)
            .Bind([secret](Unit) {
                return DeriveWithNameHash(
                    secret.first(Constants::X_25519_PRIVATE_KEY_SIZE),
                    secret.last(Constants::ED_25519_SEED_SIZE),
                    LxmfDeliveryNameHash());
            });
    }

    Result<DerivedIdentity, IdentityFailure> AddressDeriver::Derive(const IdentitySecret& secret) {
        return SodiumInterop::Initialize()
            .MapErr(IdentityFailure::FromSodiumFailure)
            .Bind([&secret](Unit) {
                return DeriveWithNameHash(secret.X25519Private(), secret.Ed25519Seed(), LxmfDeliveryNameHash());
            });
    }

    Result<DerivedIdentity, IdentityFailure> AddressDeriver::Derive(
        const IdentitySecret& secret,
        const DestinationName& destination) {
        return SodiumInterop::Initialize()
            .MapErr(IdentityFailure::FromSodiumFailure)
            .Bind([&secret, &destination](Unit) {
                return DeriveWithNameHash(
                    secret.X25519Private(), secret.Ed25519Seed(), destination.ComputeNameHash());
            });
    }

    Result<PublicKey, IdentityFailure> AddressDeriver::DerivePublicKey(const IdentitySecret& secret) {
        return SodiumInterop::Initialize()
            .MapErr(IdentityFailure::FromSodiumFailure)
            .Bind([&secret](Unit) { return DerivePublicKey(secret.X25519Private(), secret.Ed25519Seed()); });
    }

    Result<PublicKey, IdentityFailure> AddressDeriver::DerivePublicKey(
        std::span<const uint8_t> x25519_private,
        std::span<const uint8_t> ed25519_seed) {
        auto x25519_result = SodiumInterop::DeriveX25519PublicKey(x25519_private);
        if (x25519_result.IsErr()) {
            return Result<PublicKey, IdentityFailure>::Err(std::move(x25519_result).UnwrapErr());
        }
        auto ed25519_result = SodiumInterop::DeriveEd25519PublicKey(ed25519_seed);
        if (ed25519_result.IsErr()) {
            return Result<PublicKey, IdentityFailure>::Err(std::move(ed25519_result).UnwrapErr());
        }
        const auto& x25519_public = x25519_result.Unwrap();
        const auto& ed25519_public = ed25519_result.Unwrap();
        PublicKey public_key{};
        auto out = std::copy(x25519_public.begin(), x25519_public.end(), public_key.begin());
        std::copy(ed25519_public.begin(), ed25519_public.end(), out);
        return Result<PublicKey, IdentityFailure>::Ok(public_key);
    }

    IdentityHash AddressDeriver::ComputeIdentityHash(std::span<const uint8_t> public_key) {
        const auto digest = SodiumInterop::Sha256(public_key);
        IdentityHash identity_hash{};
        std::copy_n(digest.begin(), identity_hash.size(), identity_hash.begin());
        return identity_hash;
    }

    Address AddressDeriver::ComputeDestinationHash(
        const NameHash& name_hash,
        const IdentityHash& identity_hash) {
        std::array<uint8_t, Constants::NAME_HASH_SIZE + Constants::IDENTITY_HASH_SIZE> material{};
        auto out = std::copy(name_hash.begin(), name_hash.end(), material.begin());
        std::copy(identity_hash.begin(), identity_hash.end(), out);
        const auto digest = SodiumInterop::Sha256(material);
        Address address{};
        std::copy_n(digest.begin(), address.size(), address.begin());
        return address;
    }

    const NameHash& AddressDeriver::LxmfDeliveryNameHash() {
        static const NameHash name_hash = DestinationName::LxmfDelivery().ComputeNameHash();
        return name_hash;
    }

    Result<DerivedIdentity, IdentityFailure> AddressDeriver::DeriveWithNameHash(
        std::span<const uint8_t> x25519_private,
        std::span<const uint8_t> ed25519_seed,
        const NameHash& name_hash) {
        auto public_key_result = DerivePublicKey(x25519_private, ed25519_seed);
        if (public_key_result.IsErr()) {
            return Result<DerivedIdentity, IdentityFailure>::Err(
                std::move(public_key_result).UnwrapErr());
        }
        DerivedIdentity derived;
        derived.public_key = public_key_result.Unwrap();
        derived.identity_hash = ComputeIdentityHash(derived.public_key);
        derived.address = ComputeDestinationHash(name_hash, derived.identity_hash);

        debug::LogAddressDerivation("LIBSODIUM DERIVATION",
            x25519_private, ed25519_seed,
            derived.public_key, derived.identity_hash, name_hash, derived.address);

        return Result<DerivedIdentity, IdentityFailure>::Ok(derived);
    }
}
