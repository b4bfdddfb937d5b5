#include "lxid/identity/identity_secret.hpp"
#include "lxid/crypto/sodium_interop.hpp"
#include <algorithm>
#include <format>
namespace lxid::identity {
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;

    Result<IdentitySecret, IdentityFailure> IdentitySecret::FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() != Constants::IDENTITY_SECRET_SIZE) {
            return Result<IdentitySecret, IdentityFailure>::Err(
                IdentityFailure::InvalidLength(
                    std::format("Identity secret must be {} bytes, got {}",
                        Constants::IDENTITY_SECRET_SIZE, bytes.size())));
        }
        auto handle_result = AllocateHandle();
        if (handle_result.IsErr()) {
            return Result<IdentitySecret, IdentityFailure>::Err(std::move(handle_result).UnwrapErr());
        }
        auto handle = std::move(handle_result).Unwrap();
        auto write_result = handle.Write(bytes).MapErr(IdentityFailure::FromSodiumFailure);
        if (write_result.IsErr()) {
            return Result<IdentitySecret, IdentityFailure>::Err(std::move(write_result).UnwrapErr());
        }
        return Result<IdentitySecret, IdentityFailure>::Ok(IdentitySecret(std::move(handle)));
    }

    Result<IdentitySecret, IdentityFailure> IdentitySecret::FromParts(
        std::span<const uint8_t> x25519_private,
        std::span<const uint8_t> ed25519_seed) {
        if (x25519_private.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
            return Result<IdentitySecret, IdentityFailure>::Err(
                IdentityFailure::InvalidLength(
                    std::format("X25519 private key must be {} bytes, got {}",
                        Constants::X_25519_PRIVATE_KEY_SIZE, x25519_private.size())));
        }
        if (ed25519_seed.size() != Constants::ED_25519_SEED_SIZE) {
            return Result<IdentitySecret, IdentityFailure>::Err(
                IdentityFailure::InvalidLength(
                    std::format("Ed25519 seed must be {} bytes, got {}",
                        Constants::ED_25519_SEED_SIZE, ed25519_seed.size())));
        }
        auto handle_result = AllocateHandle();
        if (handle_result.IsErr()) {
            return Result<IdentitySecret, IdentityFailure>::Err(std::move(handle_result).UnwrapErr());
        }
        auto handle = std::move(handle_result).Unwrap();
        const auto region = handle.MutableView();
        const auto out = std::copy(x25519_private.begin(), x25519_private.end(), region.begin());
        std::copy(ed25519_seed.begin(), ed25519_seed.end(), out);
        return Result<IdentitySecret, IdentityFailure>::Ok(IdentitySecret(std::move(handle)));
    }

    IdentitySecret::IdentitySecret(SecureMemoryHandle handle) noexcept
        : handle_(std::move(handle)) {
    }

    Result<SecureMemoryHandle, IdentityFailure> IdentitySecret::AllocateHandle() {
        return SodiumInterop::Initialize()
            .Bind([](Unit) { return SecureMemoryHandle::Allocate(Constants::IDENTITY_SECRET_SIZE); })
            .MapErr(IdentityFailure::FromSodiumFailure);
    }
}
