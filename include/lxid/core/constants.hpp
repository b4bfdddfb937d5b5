#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace lxid {
struct Constants {
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SEED_SIZE = 32;
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t IDENTITY_SECRET_SIZE = X_25519_PRIVATE_KEY_SIZE + ED_25519_SEED_SIZE;
    static constexpr size_t PUBLIC_KEY_SIZE = X_25519_PUBLIC_KEY_SIZE + ED_25519_PUBLIC_KEY_SIZE;
    static constexpr size_t SHA_256_DIGEST_SIZE = 32;
    static constexpr size_t IDENTITY_HASH_SIZE = 16;
    static constexpr size_t NAME_HASH_SIZE = 10;
    static constexpr size_t ADDRESS_SIZE = 16;
    static constexpr size_t ADDRESS_NIBBLE_COUNT = ADDRESS_SIZE * 2;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct X25519Clamp {
    static constexpr uint8_t BYTE_0_MASK = 248;
    static constexpr uint8_t BYTE_31_MASK = 127;
    static constexpr uint8_t BYTE_31_SET = 64;
};
struct DestinationConstants {
    static constexpr std::string_view LXMF_APP_NAME = "lxmf";
    static constexpr std::string_view LXMF_DELIVERY_ASPECT = "delivery";
    static constexpr std::string_view LXMF_DELIVERY_NAME = "lxmf.delivery";
    static constexpr char ASPECT_SEPARATOR = '.';
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct CompanionTextConstants {
    static constexpr std::string_view FILE_SUFFIX = ".txt";
    static constexpr std::string_view ADDRESS_MARKER = "Address (LXMF):";
    static constexpr std::string_view IDENTITY_HASH_MARKER = "Identity Hash:";
};
struct VanityConstants {
    static constexpr size_t MAX_PATTERN_LENGTH = Constants::ADDRESS_NIBBLE_COUNT;
    static constexpr std::string_view DEFAULT_OUTPUT_PATH = "identity";
    static constexpr std::chrono::milliseconds DEFAULT_PROGRESS_INTERVAL{1000};
    static constexpr uint64_t THOUSAND = 1'000;
    static constexpr uint64_t MILLION = 1'000'000;
};
struct ExitCodes {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = 1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view X25519_DERIVATION_FAILED = "Failed to derive X25519 public key";
    static constexpr std::string_view ED25519_DERIVATION_FAILED = "Failed to derive Ed25519 public key from seed";
    static constexpr std::string_view SHA256_FAILED = "SHA-256 computation failed";
    static constexpr std::string_view SECURE_ALLOCATION_FAILED = "Failed to allocate secure memory";
    static constexpr std::string_view HANDLE_DISPOSED = "Secure memory handle has been released";
};
}
