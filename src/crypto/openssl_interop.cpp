#include "lxid/crypto/openssl_interop.hpp"
#include "lxid/core/constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <format>
#include <memory>
namespace lxid::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_PKEY_Deleter {
        void operator()(EVP_PKEY* key) const {
            if (key) {
                EVP_PKEY_free(key);
            }
        }
    };
    using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;

    template<size_t N>
    Result<std::array<uint8_t, N>, IdentityFailure> DerivePublicKey(
        const int key_type,
        const std::string_view algorithm,
        std::span<const uint8_t> private_key) {
        if (private_key.size() != N) {
            return Result<std::array<uint8_t, N>, IdentityFailure>::Err(
                IdentityFailure::InvalidLength(
                    std::format("{} private key must be {} bytes, got {}",
                        algorithm, N, private_key.size())));
        }
        EVP_PKEY_ptr key(EVP_PKEY_new_raw_private_key(
            key_type, nullptr, private_key.data(), private_key.size()));
        if (!key) {
            return Result<std::array<uint8_t, N>, IdentityFailure>::Err(
                IdentityFailure::KeyDerivation(
                    std::format("Failed to load {} private key: {}",
                        algorithm, OpenSslInterop::LastError())));
        }
        std::array<uint8_t, N> public_key{};
        size_t public_key_len = public_key.size();
        if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &public_key_len) != OpenSSL::SUCCESS
            || public_key_len != N) {
            return Result<std::array<uint8_t, N>, IdentityFailure>::Err(
                IdentityFailure::KeyDerivation(
                    std::format("Failed to extract {} public key: {}",
                        algorithm, OpenSslInterop::LastError())));
        }
        return Result<std::array<uint8_t, N>, IdentityFailure>::Ok(public_key);
    }
}
Result<identity::X25519PublicKey, IdentityFailure>
OpenSslInterop::DeriveX25519PublicKey(std::span<const uint8_t> private_key) {
    return DerivePublicKey<Constants::X_25519_PUBLIC_KEY_SIZE>(
        EVP_PKEY_X25519, "X25519", private_key);
}
Result<identity::Ed25519PublicKey, IdentityFailure>
OpenSslInterop::DeriveEd25519PublicKey(std::span<const uint8_t> seed) {
    return DerivePublicKey<Constants::ED_25519_PUBLIC_KEY_SIZE>(
        EVP_PKEY_ED25519, "Ed25519", seed);
}
Result<identity::Sha256Digest, IdentityFailure>
OpenSslInterop::Sha256(std::span<const uint8_t> data) {
    identity::Sha256Digest digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
                   EVP_sha256(), nullptr) != OpenSSL::SUCCESS
        || digest_len != digest.size()) {
        return Result<identity::Sha256Digest, IdentityFailure>::Err(
            IdentityFailure::Hashing(
                std::format("{}: {}", ErrorMessages::SHA256_FAILED, LastError())));
    }
    return Result<identity::Sha256Digest, IdentityFailure>::Ok(digest);
}
std::string OpenSslInterop::LastError() {
    const unsigned long err = ERR_get_error();
    if (err == OpenSSL::NO_ERROR) {
        return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}
}
