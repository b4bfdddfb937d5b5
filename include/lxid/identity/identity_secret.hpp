#pragma once
#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/core/constants.hpp"
#include "lxid/crypto/secure_memory_handle.hpp"
#include <array>
#include <cstdint>
#include <span>
namespace lxid::identity {
/// The 64-byte private identity blob: X25519 private scalar followed by the
/// Ed25519 seed. Held in sodium_malloc memory; a moved-from secret is empty.
class IdentitySecret {
public:
    /// Stack layout of the blob, for callers that stage bytes before storing them.
    using Bytes = std::array<uint8_t, Constants::IDENTITY_SECRET_SIZE>;

    [[nodiscard]] static Result<IdentitySecret, IdentityFailure> FromBytes(
        std::span<const uint8_t> bytes);
    [[nodiscard]] static Result<IdentitySecret, IdentityFailure> FromParts(
        std::span<const uint8_t> x25519_private,
        std::span<const uint8_t> ed25519_seed);

    IdentitySecret(IdentitySecret&&) noexcept = default;
    IdentitySecret& operator=(IdentitySecret&&) noexcept = default;
    IdentitySecret(const IdentitySecret&) = delete;
    IdentitySecret& operator=(const IdentitySecret&) = delete;
    ~IdentitySecret() = default;

    [[nodiscard]] bool IsEmpty() const noexcept {
        return handle_.IsInvalid();
    }

    [[nodiscard]] std::span<const uint8_t> AsBytes() const noexcept {
        return handle_.View();
    }
    [[nodiscard]] std::span<const uint8_t> X25519Private() const noexcept {
        return IsEmpty() ? std::span<const uint8_t>() : AsBytes().first(Constants::X_25519_PRIVATE_KEY_SIZE);
    }
    [[nodiscard]] std::span<const uint8_t> Ed25519Seed() const noexcept {
        return IsEmpty() ? std::span<const uint8_t>() : AsBytes().last(Constants::ED_25519_SEED_SIZE);
    }
private:
    explicit IdentitySecret(crypto::SecureMemoryHandle handle) noexcept;

    static Result<crypto::SecureMemoryHandle, IdentityFailure> AllocateHandle();

    crypto::SecureMemoryHandle handle_;
};
}
