#pragma once
#include "lxid/encoding/hex.hpp"
#include "lxid/identity/identity_secret.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lxid::test_helpers {

/// Fixed identities with expected values computed independently (OpenSSL CLI).
struct AddressVector {
    std::string_view x25519_private;
    std::string_view ed25519_seed;
    std::string_view x25519_public;
    std::string_view ed25519_public;
    std::string_view identity_hash;
    std::string_view address;
};

inline constexpr AddressVector kAllZeroVector{
    "0000000000000000000000000000000000000000000000000000000000000000",
    "0000000000000000000000000000000000000000000000000000000000000000",
    "2fe57da347cd62431528daac5fbb290730fff684afc4cfc2ed90995f58cb3b74",
    "3b6a27bcceb6a42d62a3a8d02a6f0d73653215771de243a63ac048a18b59da29",
    "d7db22f63b453c23bb0688dde565b7c1",
    "abe3d7ce96f80910fa22f2e7d3bc8026",
};

/// X25519 private key from RFC 7748 6.1 (Alice), Ed25519 seed from RFC 8032 7.1 test 1.
inline constexpr AddressVector kRfcVector{
    "77076d0a7318a57d3c16c17251b26645df4c2f87ebc0992ab177fba51db92c2a",
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60",
    "8520f0098930a754748b7ddcb43ef75a0dbf3a0d26381af4eba4a98eaa9b4e6a",
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a",
    "48f7e3807dce41a286611331ddfbe99d",
    "91eb19b62a69a9913d50e49f6376e7a0",
};

inline constexpr std::string_view kLxmfDeliveryNameHash = "6ec60bc318e2c0f0d908";

inline std::vector<uint8_t> HexBytes(std::string_view hex) {
    auto result = encoding::FromHex(hex);
    if (result.IsErr()) {
        throw std::invalid_argument(result.UnwrapErr().message);
    }
    return std::move(result).Unwrap();
}

inline identity::IdentitySecret SecretFrom(const AddressVector& vector) {
    const auto x25519 = HexBytes(vector.x25519_private);
    const auto ed25519 = HexBytes(vector.ed25519_seed);
    return identity::IdentitySecret::FromParts(x25519, ed25519).Unwrap();
}

inline identity::IdentitySecret SecretFilledWith(const uint8_t value) {
    const std::vector<uint8_t> bytes(Constants::IDENTITY_SECRET_SIZE, value);
    return identity::IdentitySecret::FromBytes(bytes).Unwrap();
}

} // namespace lxid::test_helpers
