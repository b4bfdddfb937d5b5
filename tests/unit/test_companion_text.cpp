#include <catch2/catch_test_macros.hpp>
#include "lxid/identity/companion_text.hpp"
#include "lxid/identity/address_deriver.hpp"
#include "lxid/crypto/sodium_interop.hpp"
#include "helpers/test_vectors.hpp"
#include <cctype>
#include <string>
using namespace lxid;
using namespace lxid::identity;
using namespace lxid::test_helpers;

TEST_CASE("CompanionText - private key matching", "[identity][companion]") {
    const auto secret = SecretFrom(kRfcVector);

    SECTION("Both hex strings present") {
        const std::string content = std::string("x: ") + std::string(kRfcVector.x25519_private)
            + "\nseed: " + std::string(kRfcVector.ed25519_seed) + "\n";
        const auto check = CompanionText::Check(content, secret);
        REQUIRE(check.x25519_private_matches);
        REQUIRE(check.ed25519_seed_matches);
        REQUIRE(check.AllMatch());
    }
    SECTION("Seed missing") {
        const std::string content = std::string(kRfcVector.x25519_private);
        const auto check = CompanionText::Check(content, secret);
        REQUIRE(check.x25519_private_matches);
        REQUIRE_FALSE(check.ed25519_seed_matches);
        REQUIRE_FALSE(check.AllMatch());
    }
    SECTION("X25519 key missing") {
        const std::string content = std::string(kRfcVector.ed25519_seed);
        const auto check = CompanionText::Check(content, secret);
        REQUIRE_FALSE(check.x25519_private_matches);
        REQUIRE(check.ed25519_seed_matches);
    }
    SECTION("Uppercase hex does not match") {
        std::string upper(kRfcVector.ed25519_seed);
        for (auto& c : upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        REQUIRE_FALSE(CompanionText::ContainsHexOf(upper, secret.Ed25519Seed()));
    }
}

TEST_CASE("CompanionText - echoed lines", "[identity][companion]") {
    const auto secret = SecretFilledWith(0x01);
    const std::string content =
        "header\r\n"
        "Address (LXMF): 00112233445566778899aabbccddeeff\r\n"
        "  Address (LXMF): indented lines are not echoed\n"
        "Identity Hash:  ffeeddccbbaa99887766554433221100\n"
        "trailer";
    const auto check = CompanionText::Check(content, secret);
    REQUIRE(check.echoed_lines.size() == 2);
    REQUIRE(check.echoed_lines[0] == "Address (LXMF): 00112233445566778899aabbccddeeff");
    REQUIRE(check.echoed_lines[1] == "Identity Hash:  ffeeddccbbaa99887766554433221100");
}

TEST_CASE("CompanionText - rendered dump", "[identity][companion]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto secret = SecretFrom(kRfcVector);
    const auto derived = AddressDeriver::Derive(secret).Unwrap();
    const auto text = CompanionText::Render(secret, derived);

    SECTION("Layout") {
        REQUIRE(text.starts_with("LXMF Vanity Address Identity\n============================\n\n"));
        REQUIRE(text.find("Address (LXMF): " + std::string(kRfcVector.address) + "\n") != std::string::npos);
        REQUIRE(text.find("Identity Hash:  " + std::string(kRfcVector.identity_hash) + "\n") != std::string::npos);
        REQUIRE(text.find("  X25519 Public:  " + std::string(kRfcVector.x25519_public)) != std::string::npos);
        REQUIRE(text.find("  Ed25519 Public: " + std::string(kRfcVector.ed25519_public)) != std::string::npos);
        REQUIRE(text.find("  Ed25519 Seed:   " + std::string(kRfcVector.ed25519_seed)) != std::string::npos);
        REQUIRE(text.find("--- Import formats ---\nBase64 (MeshChat import string):\n") != std::string::npos);
        REQUIRE(text.ends_with(
            "Base32 (Sideband import string):\n"
            "O4DW2CTTDCSX2PAWYFZFDMTGIXPUYL4H5PAJSKVRO752KHNZFQVJ2YNRTXX72WTAXKCEV5ES5QWMIRCJYVUXWMTJDFYDXLADDSXH6YA=\n"));
    }
    SECTION("Rendered dump passes its own check") {
        const auto check = CompanionText::Check(text, secret);
        REQUIRE(check.AllMatch());
        REQUIRE(check.echoed_lines.size() == 2);
    }
}
