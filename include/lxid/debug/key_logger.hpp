#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug tracing of key material and intermediate digests.
 *
 * SECURITY WARNING: prints private keys to stdout. Only for checking
 * derivation steps against another implementation.
 *
 * Enable via CMake: -DLXID_DEBUG_KEYS=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace lxid::debug {

#ifdef LXID_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

#define LXID_LOG_KEY(operation, key_name, data) \
    do { \
        fprintf(stdout, "[LXID-DEBUG] %s %s: %s\n", \
            operation, \
            key_name, \
            ::lxid::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define LXID_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[LXID-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define LXID_LOG_MSG(operation, message) \
    do { \
        fprintf(stdout, "[LXID-DEBUG] %s %s\n", operation, message); \
        fflush(stdout); \
    } while(0)

#define LXID_LOG_SECTION(section_name) \
    do { \
        fprintf(stdout, "[LXID-DEBUG] ========== %s ==========\n", section_name); \
        fflush(stdout); \
    } while(0)

inline void LogAddressDerivation(
    const char* source,
    std::span<const uint8_t> x25519_private,
    std::span<const uint8_t> ed25519_seed,
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> identity_hash,
    std::span<const uint8_t> name_hash,
    std::span<const uint8_t> address) {

    LXID_LOG_SECTION(source);
    LXID_LOG_KEY("DERIVE", "x25519_private", x25519_private);
    LXID_LOG_KEY("DERIVE", "ed25519_seed", ed25519_seed);
    LXID_LOG_KEY("DERIVE", "public_key", public_key);
    LXID_LOG_KEY("DERIVE", "identity_hash", identity_hash);
    LXID_LOG_KEY("DERIVE", "name_hash", name_hash);
    LXID_LOG_KEY("DERIVE", "address", address);
}

inline void LogVanityMatch(
    uint64_t attempts,
    std::span<const uint8_t> address) {

    LXID_LOG_SECTION("VANITY MATCH");
    LXID_LOG_VALUE("VANITY", "attempts", attempts);
    LXID_LOG_KEY("VANITY", "address", address);
}

#else // !LXID_DEBUG_KEYS

#define LXID_LOG_KEY(operation, key_name, data) ((void)0)
#define LXID_LOG_VALUE(operation, name, value) ((void)0)
#define LXID_LOG_MSG(operation, message) ((void)0)
#define LXID_LOG_SECTION(section_name) ((void)0)

inline void LogAddressDerivation(const char*, std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>, std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>) {}
inline void LogVanityMatch(uint64_t, std::span<const uint8_t>) {}

#endif // LXID_DEBUG_KEYS

} // namespace lxid::debug
