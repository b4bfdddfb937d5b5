#include <catch2/catch_test_macros.hpp>
#include "lxid/vanity/address_pattern.hpp"
#include "helpers/test_vectors.hpp"
#include <algorithm>
#include <string>
using namespace lxid;
using namespace lxid::vanity;
using namespace lxid::test_helpers;

namespace {
identity::Address AddressFromHex(std::string_view hex) {
    const auto bytes = HexBytes(hex);
    identity::Address address{};
    std::copy(bytes.begin(), bytes.end(), address.begin());
    return address;
}
}

TEST_CASE("AddressPattern - validation", "[vanity][pattern]") {
    SECTION("Neither prefix nor postfix") {
        auto result = AddressPattern::Parse("", "");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == IdentityFailureType::InvalidInput);
    }
    SECTION("Non-hex characters") {
        REQUIRE(AddressPattern::Parse("xyz", "").IsErr());
        REQUIRE(AddressPattern::Parse("", "12 4").IsErr());
    }
    SECTION("Too long") {
        REQUIRE(AddressPattern::Parse(std::string(33, 'a'), "").IsErr());
        REQUIRE(AddressPattern::Parse("", std::string(33, 'a')).IsErr());
    }
    SECTION("Full length is accepted") {
        REQUIRE(AddressPattern::Parse(std::string(32, 'a'), "").IsOk());
    }
    SECTION("Patterns are lowercased") {
        auto result = AddressPattern::Parse("ABcd", "EF");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().Prefix() == "abcd");
        REQUIRE(result.Unwrap().Postfix() == "ef");
    }
}

TEST_CASE("AddressPattern - nibble matching", "[vanity][pattern]") {
    const auto address = AddressFromHex(kRfcVector.address);  // 91eb19b6...6376e7a0

    SECTION("Prefix") {
        REQUIRE(AddressPattern::Parse("9", "").Unwrap().Matches(address));
        REQUIRE(AddressPattern::Parse("91e", "").Unwrap().Matches(address));
        REQUIRE(AddressPattern::Parse("91EB19", "").Unwrap().Matches(address));
        REQUIRE_FALSE(AddressPattern::Parse("92", "").Unwrap().Matches(address));
        REQUIRE_FALSE(AddressPattern::Parse("1", "").Unwrap().Matches(address));
    }
    SECTION("Postfix aligns with the last nibble") {
        REQUIRE(AddressPattern::Parse("", "0").Unwrap().Matches(address));
        REQUIRE(AddressPattern::Parse("", "7a0").Unwrap().Matches(address));
        REQUIRE(AddressPattern::Parse("", "e7a0").Unwrap().Matches(address));
        REQUIRE_FALSE(AddressPattern::Parse("", "a").Unwrap().Matches(address));
    }
    SECTION("Prefix and postfix together") {
        REQUIRE(AddressPattern::Parse("91", "a0").Unwrap().Matches(address));
        REQUIRE_FALSE(AddressPattern::Parse("91", "a1").Unwrap().Matches(address));
    }
    SECTION("Whole address") {
        REQUIRE(AddressPattern::Parse(kRfcVector.address, "").Unwrap().Matches(address));
        REQUIRE(AddressPattern::Parse("", kRfcVector.address).Unwrap().Matches(address));
    }
}
