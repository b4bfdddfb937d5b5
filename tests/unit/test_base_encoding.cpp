#include <catch2/catch_test_macros.hpp>
#include "lxid/crypto/sodium_interop.hpp"
#include "lxid/encoding/base_encoding.hpp"
#include "helpers/test_vectors.hpp"
#include <string>
using namespace lxid;
using namespace lxid::encoding;
using namespace lxid::test_helpers;

namespace {
std::span<const uint8_t> AsBytes(const std::string& text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}
}

TEST_CASE("Base64 - standard padded alphabet", "[encoding][base64]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("RFC 4648 samples") {
        REQUIRE(ToBase64(AsBytes("")).empty());
        REQUIRE(ToBase64(AsBytes("f")) == "Zg==");
        REQUIRE(ToBase64(AsBytes("fo")) == "Zm8=");
        REQUIRE(ToBase64(AsBytes("foobar")) == "Zm9vYmFy");
    }
    SECTION("Identity secret import string") {
        const auto secret = SecretFrom(kRfcVector);
        REQUIRE(ToBase64(secret.AsBytes()) ==
            "dwdtCnMYpX08FsFyUbJmRd9ML4frwJkqsXf7pR25LCqdYbGd7/1aYLqESvSS7CzEREnFaXsyaRlwO6wDHK5/YA==");
    }
}

TEST_CASE("Base32 - RFC 4648 uppercase padded", "[encoding][base32]") {
    SECTION("RFC 4648 samples") {
        REQUIRE(ToBase32(AsBytes("")).empty());
        REQUIRE(ToBase32(AsBytes("f")) == "MY======");
        REQUIRE(ToBase32(AsBytes("fo")) == "MZXQ====");
        REQUIRE(ToBase32(AsBytes("foobar")) == "MZXW6YTBOI======");
    }
    SECTION("Identity secret import string") {
        const auto secret = SecretFrom(kRfcVector);
        REQUIRE(ToBase32(secret.AsBytes()) ==
            "O4DW2CTTDCSX2PAWYFZFDMTGIXPUYL4H5PAJSKVRO752KHNZFQVJ2YNRTXX72WTAXKCEV5ES5QWMIRCJYVUXWMTJDFYDXLADDSXH6YA=");
    }
    SECTION("64 zero bytes") {
        const auto secret = SecretFilledWith(0x00);
        const auto encoded = ToBase32(secret.AsBytes());
        REQUIRE(encoded.size() == 104);
        REQUIRE(encoded == std::string(103, 'A') + "=");
    }
}
