#pragma once

#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/core/constants.hpp"
#include "lxid/identity/identity_types.hpp"

#include <sodium.h>
#include <atomic>
#include <span>
#include <vector>
#include <cstddef>

namespace lxid::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * All key derivation and hashing on the local (non-reference) path goes
 * through here. Initialize() must succeed before any other call.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /// Zeroes the buffer with sodium_memzero. Fails only before Initialize().
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief X25519 scalar multiplication by the base point
     *
     * The scalar is clamped by libsodium, so any 32-byte string is accepted.
     */
    static Result<identity::X25519PublicKey, IdentityFailure> DeriveX25519PublicKey(
        std::span<const uint8_t> private_key);

    /**
     * @brief Ed25519 public key from a 32-byte seed (SHA-512 expansion)
     */
    static Result<identity::Ed25519PublicKey, IdentityFailure> DeriveEd25519PublicKey(
        std::span<const uint8_t> seed);

    static identity::Sha256Digest Sha256(std::span<const uint8_t> data);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void FillRandom(std::span<uint8_t> buffer);

    /// sodium_malloc; nullptr before Initialize() or when the allocation fails.
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace lxid::crypto
