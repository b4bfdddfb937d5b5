#include <catch2/catch_test_macros.hpp>
#include "lxid/encoding/hex.hpp"
using namespace lxid;
using namespace lxid::encoding;

TEST_CASE("Hex - ToHex", "[encoding][hex]") {
    SECTION("Lowercase, two digits per byte") {
        const std::vector<uint8_t> bytes = {0x00, 0x0F, 0xAB, 0xFF};
        REQUIRE(ToHex(bytes) == "000fabff");
    }
    SECTION("Empty input") {
        REQUIRE(ToHex(std::span<const uint8_t>()).empty());
    }
}

TEST_CASE("Hex - FromHex", "[encoding][hex]") {
    SECTION("Mixed case decodes") {
        auto result = FromHex("DeadBEEF");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});
    }
    SECTION("Odd length is a decode error") {
        auto result = FromHex("abc");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == IdentityFailureType::Decode);
    }
    SECTION("Non-hex characters are a decode error") {
        auto result = FromHex("zz");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == IdentityFailureType::Decode);
    }
    SECTION("Empty string decodes to nothing") {
        auto result = FromHex("");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().empty());
    }
}

TEST_CASE("Hex - digit helpers", "[encoding][hex]") {
    REQUIRE(IsHex("0123456789abcdefABCDEF"));
    REQUIRE_FALSE(IsHex("12g4"));
    REQUIRE_FALSE(IsHexDigit(' '));
    REQUIRE(HexDigitValue('0') == 0);
    REQUIRE(HexDigitValue('a') == 10);
    REQUIRE(HexDigitValue('F') == 15);
}
