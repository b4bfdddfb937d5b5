#pragma once
#include "lxid/core/constants.hpp"
#include <array>
#include <cstdint>
namespace lxid::identity {
using X25519PublicKey = std::array<uint8_t, Constants::X_25519_PUBLIC_KEY_SIZE>;
using Ed25519PublicKey = std::array<uint8_t, Constants::ED_25519_PUBLIC_KEY_SIZE>;
using PublicKey = std::array<uint8_t, Constants::PUBLIC_KEY_SIZE>;
using IdentityHash = std::array<uint8_t, Constants::IDENTITY_HASH_SIZE>;
using NameHash = std::array<uint8_t, Constants::NAME_HASH_SIZE>;
using Address = std::array<uint8_t, Constants::ADDRESS_SIZE>;
using Sha256Digest = std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE>;
}
