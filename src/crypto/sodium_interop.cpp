#include "lxid/crypto/sodium_interop.hpp"

#include <array>
#include <format>
#include <string>

namespace lxid::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    // sodium_init() is itself idempotent; the static only records its outcome once.
    static const bool ready = [] {
        const bool ok = sodium_init() >= 0;
        initialized_.store(ok, std::memory_order_release);
        return ok;
    }();
    if (ready) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    return Result<Unit, SodiumFailure>::Err(
        SodiumFailure::InitializationFailed(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Key derivation
// ============================================================================

Result<identity::X25519PublicKey, IdentityFailure>
SodiumInterop::DeriveX25519PublicKey(std::span<const uint8_t> private_key) {
    using R = Result<identity::X25519PublicKey, IdentityFailure>;
    if (private_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
        return R::Err(IdentityFailure::InvalidLength(
            std::format("X25519 private key must be {} bytes, got {}",
                Constants::X_25519_PRIVATE_KEY_SIZE, private_key.size())));
    }
    if (!IsInitialized()) {
        return R::Err(IdentityFailure::KeyDerivation(std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    identity::X25519PublicKey public_key{};
    if (crypto_scalarmult_base(public_key.data(), private_key.data()) != SodiumConstants::SUCCESS) {
        return R::Err(IdentityFailure::KeyDerivation(std::string(ErrorMessages::X25519_DERIVATION_FAILED)));
    }
    return R::Ok(public_key);
}

Result<identity::Ed25519PublicKey, IdentityFailure>
SodiumInterop::DeriveEd25519PublicKey(std::span<const uint8_t> seed) {
    using R = Result<identity::Ed25519PublicKey, IdentityFailure>;
    if (seed.size() != crypto_sign_SEEDBYTES) {
        return R::Err(IdentityFailure::InvalidLength(
            std::format("Ed25519 seed must be {} bytes, got {}", crypto_sign_SEEDBYTES, seed.size())));
    }
    if (!IsInitialized()) {
        return R::Err(IdentityFailure::KeyDerivation(std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    // The expanded secret key is a by-product; only the public half leaves here.
    identity::Ed25519PublicKey public_key{};
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> expanded_secret{};
    const int rc = crypto_sign_seed_keypair(public_key.data(), expanded_secret.data(), seed.data());
    sodium_memzero(expanded_secret.data(), expanded_secret.size());
    if (rc != SodiumConstants::SUCCESS) {
        return R::Err(IdentityFailure::KeyDerivation(std::string(ErrorMessages::ED25519_DERIVATION_FAILED)));
    }
    return R::Ok(public_key);
}

identity::Sha256Digest SodiumInterop::Sha256(std::span<const uint8_t> data) {
    identity::Sha256Digest digest{};
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

// ============================================================================
// Randomness and wiping
// ============================================================================

void SodiumInterop::FillRandom(std::span<uint8_t> buffer) {
    randombytes_buf(buffer.data(), buffer.size());
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> bytes(size);
    FillRandom(bytes);
    return bytes;
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::NotInitialized(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace lxid::crypto
