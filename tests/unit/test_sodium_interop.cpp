#include <catch2/catch_test_macros.hpp>
#include "lxid/crypto/sodium_interop.hpp"
#include "lxid/core/constants.hpp"
#include "lxid/encoding/hex.hpp"
#include "helpers/test_vectors.hpp"
#include <algorithm>
#include <array>
#include <string>
#include <vector>
using namespace lxid;
using namespace lxid::crypto;
using namespace lxid::test_helpers;

TEST_CASE("SodiumInterop - Initialize is idempotent", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::IsInitialized());
    for (int i = 0; i < 3; ++i) {
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - SecureWipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Key-sized buffer is zeroed") {
        auto secret = SecretFilledWith(0xA5);
        std::array<uint8_t, Constants::IDENTITY_SECRET_SIZE> bytes{};
        std::copy(secret.AsBytes().begin(), secret.AsBytes().end(), bytes.begin());
        REQUIRE(SodiumInterop::SecureWipe(bytes).IsOk());
        REQUIRE(bytes == std::array<uint8_t, Constants::IDENTITY_SECRET_SIZE>{});
    }
    SECTION("Empty span is a no-op") {
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>()).IsOk());
    }
}

TEST_CASE("SodiumInterop - X25519 public key derivation", "[sodium][crypto][x25519]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("RFC 7748 Alice key") {
        auto result = SodiumInterop::DeriveX25519PublicKey(HexBytes(kRfcVector.x25519_private));
        REQUIRE(result.IsOk());
        REQUIRE(encoding::ToHex(result.Unwrap()) == kRfcVector.x25519_public);
    }
    SECTION("All-zero scalar is accepted") {
        const std::vector<uint8_t> zero(Constants::X_25519_PRIVATE_KEY_SIZE, 0x00);
        auto result = SodiumInterop::DeriveX25519PublicKey(zero);
        REQUIRE(result.IsOk());
        REQUIRE(encoding::ToHex(result.Unwrap()) == kAllZeroVector.x25519_public);
    }
    SECTION("Wrong length is rejected") {
        const std::vector<uint8_t> short_key(31, 0x01);
        auto result = SodiumInterop::DeriveX25519PublicKey(short_key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == IdentityFailureType::InvalidLength);
    }
}

TEST_CASE("SodiumInterop - Ed25519 public key derivation", "[sodium][crypto][ed25519]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("RFC 8032 test 1 seed") {
        auto result = SodiumInterop::DeriveEd25519PublicKey(HexBytes(kRfcVector.ed25519_seed));
        REQUIRE(result.IsOk());
        REQUIRE(encoding::ToHex(result.Unwrap()) == kRfcVector.ed25519_public);
    }
    SECTION("Same seed gives same key") {
        const auto seed = SodiumInterop::GetRandomBytes(Constants::ED_25519_SEED_SIZE);
        auto first = SodiumInterop::DeriveEd25519PublicKey(seed);
        auto second = SodiumInterop::DeriveEd25519PublicKey(seed);
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE(first.Unwrap() == second.Unwrap());
    }
    SECTION("Wrong length is rejected") {
        const std::vector<uint8_t> long_seed(33, 0x01);
        auto result = SodiumInterop::DeriveEd25519PublicKey(long_seed);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == IdentityFailureType::InvalidLength);
    }
}

TEST_CASE("SodiumInterop - SHA-256", "[sodium][crypto][sha256]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Digest of the LXMF delivery name") {
        const std::string name = "lxmf.delivery";
        const auto digest = SodiumInterop::Sha256(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(name.data()), name.size()));
        REQUIRE(encoding::ToHex(digest) ==
            "6ec60bc318e2c0f0d9086e596e657ef25d25bbe95a1379c3b6eb3ad59af2e7db");
    }
    SECTION("Digest of empty input") {
        const auto digest = SodiumInterop::Sha256(std::span<const uint8_t>());
        REQUIRE(encoding::ToHex(digest) ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }
}

TEST_CASE("SodiumInterop - Random Number Generation", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("GetRandomBytes generates correct size") {
        auto bytes = SodiumInterop::GetRandomBytes(32);
        REQUIRE(bytes.size() == 32);
    }
    SECTION("GetRandomBytes generates different values") {
        auto bytes1 = SodiumInterop::GetRandomBytes(32);
        auto bytes2 = SodiumInterop::GetRandomBytes(32);
        REQUIRE(bytes1 != bytes2);
    }
    SECTION("FillRandom overwrites the buffer") {
        std::array<uint8_t, 64> buffer{};
        SodiumInterop::FillRandom(buffer);
        REQUIRE(buffer != std::array<uint8_t, 64>{});
    }
}
