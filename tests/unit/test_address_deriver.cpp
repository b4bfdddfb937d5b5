#include <catch2/catch_test_macros.hpp>
#include "lxid/identity/address_deriver.hpp"
#include "lxid/crypto/sodium_interop.hpp"
#include "lxid/encoding/hex.hpp"
#include "helpers/test_vectors.hpp"
#include <algorithm>
using namespace lxid;
using namespace lxid::identity;
using namespace lxid::test_helpers;
using crypto::SodiumInterop;

namespace {
IdentitySecret FlipBit(const IdentitySecret& secret, const size_t byte_index, const uint8_t mask) {
    IdentitySecret::Bytes bytes{};
    std::ranges::copy(secret.AsBytes(), bytes.begin());
    bytes[byte_index] ^= mask;
    return IdentitySecret::FromBytes(bytes).Unwrap();
}
}

TEST_CASE("AddressDeriver - determinism and sizes", "[identity][deriver]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto bytes = SodiumInterop::GetRandomBytes(Constants::IDENTITY_SECRET_SIZE);

    auto first = AddressDeriver::Derive(bytes);
    auto second = AddressDeriver::Derive(bytes);
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    REQUIRE(first.Unwrap() == second.Unwrap());

    const auto& derived = first.Unwrap();
    REQUIRE(derived.public_key.size() == 64);
    REQUIRE(derived.identity_hash.size() == 16);
    REQUIRE(derived.address.size() == 16);
    REQUIRE(derived.X25519Public().size() == 32);
    REQUIRE(derived.Ed25519Public().size() == 32);
}

TEST_CASE("AddressDeriver - length validation", "[identity][deriver]") {
    for (const size_t size : {0, 1, 32, 63, 65, 96}) {
        const std::vector<uint8_t> bytes(size, 0xAB);
        auto result = AddressDeriver::Derive(bytes);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == IdentityFailureType::InvalidLength);
    }
}

TEST_CASE("AddressDeriver - hash chain", "[identity][deriver]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto secret = SecretFrom(kRfcVector);
    auto result = AddressDeriver::Derive(secret);
    REQUIRE(result.IsOk());
    const auto& derived = result.Unwrap();

    SECTION("Identity hash is the truncated digest of the public key") {
        const auto digest = SodiumInterop::Sha256(derived.public_key);
        REQUIRE(std::equal(derived.identity_hash.begin(), derived.identity_hash.end(), digest.begin()));
        REQUIRE(AddressDeriver::ComputeIdentityHash(derived.public_key) == derived.identity_hash);
    }
    SECTION("Address is the truncated digest of name hash and identity hash") {
        std::vector<uint8_t> material(AddressDeriver::LxmfDeliveryNameHash().begin(),
                                      AddressDeriver::LxmfDeliveryNameHash().end());
        material.insert(material.end(), derived.identity_hash.begin(), derived.identity_hash.end());
        REQUIRE(material.size() == 26);
        const auto digest = SodiumInterop::Sha256(material);
        REQUIRE(std::equal(derived.address.begin(), derived.address.end(), digest.begin()));
    }
    SECTION("Public key matches the separate derivation") {
        auto public_key = AddressDeriver::DerivePublicKey(secret);
        REQUIRE(public_key.IsOk());
        REQUIRE(public_key.Unwrap() == derived.public_key);
    }
    SECTION("Explicit lxmf.delivery destination gives the same address") {
        auto explicit_result = AddressDeriver::Derive(secret, DestinationName::LxmfDelivery());
        REQUIRE(explicit_result.IsOk());
        REQUIRE(explicit_result.Unwrap() == derived);
    }
    SECTION("Another destination keeps the identity but changes the address") {
        auto name = DestinationName::Create("nomadnetwork", {"node"});
        REQUIRE(name.IsOk());
        auto other = AddressDeriver::Derive(secret, name.Unwrap());
        REQUIRE(other.IsOk());
        REQUIRE(other.Unwrap().identity_hash == derived.identity_hash);
        REQUIRE(other.Unwrap().address != derived.address);
    }
}

TEST_CASE("AddressDeriver - bit flips", "[identity][deriver]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto secret = SecretFrom(kRfcVector);
    const auto base = AddressDeriver::Derive(secret).Unwrap();

    SECTION("Flipping an X25519 bit changes the X25519 public key and the address") {
        // Bit 3 of byte 1 survives X25519 clamping.
        const auto flipped = FlipBit(secret, 1, 0x08);
        const auto derived = AddressDeriver::Derive(flipped).Unwrap();
        REQUIRE_FALSE(std::ranges::equal(derived.X25519Public(), base.X25519Public()));
        REQUIRE(std::ranges::equal(derived.Ed25519Public(), base.Ed25519Public()));
        REQUIRE(derived.address != base.address);
    }
    SECTION("Flipping an Ed25519 seed bit changes only the Ed25519 half and the address") {
        const auto flipped = FlipBit(secret, 40, 0x01);
        const auto derived = AddressDeriver::Derive(flipped).Unwrap();
        REQUIRE(std::ranges::equal(derived.X25519Public(), base.X25519Public()));
        REQUIRE_FALSE(std::ranges::equal(derived.Ed25519Public(), base.Ed25519Public()));
        REQUIRE(derived.identity_hash != base.identity_hash);
        REQUIRE(derived.address != base.address);
    }
}
