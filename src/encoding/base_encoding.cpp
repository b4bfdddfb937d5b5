#include "lxid/encoding/base_encoding.hpp"
#include <sodium.h>
#include <string_view>
namespace lxid::encoding {
namespace {
    constexpr std::string_view BASE32_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    constexpr size_t BASE32_BLOCK_BYTES = 5;
    constexpr size_t BASE32_BLOCK_CHARS = 8;
    constexpr size_t BASE32_BITS_PER_CHAR = 5;
    constexpr uint32_t BASE32_CHAR_MASK = 0x1F;
}
std::string ToBase64(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), variant);
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    // encoded_len counts the trailing NUL
    encoded.resize(encoded_len - 1);
    return encoded;
}
std::string ToBase32(std::span<const uint8_t> data) {
    std::string encoded;
    encoded.reserve((data.size() + BASE32_BLOCK_BYTES - 1) / BASE32_BLOCK_BYTES * BASE32_BLOCK_CHARS);
    uint32_t buffer = 0;
    size_t bits = 0;
    for (const uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= BASE32_BITS_PER_CHAR) {
            bits -= BASE32_BITS_PER_CHAR;
            encoded.push_back(BASE32_ALPHABET[(buffer >> bits) & BASE32_CHAR_MASK]);
        }
    }
    if (bits > 0) {
        encoded.push_back(BASE32_ALPHABET[(buffer << (BASE32_BITS_PER_CHAR - bits)) & BASE32_CHAR_MASK]);
    }
    while (encoded.size() % BASE32_BLOCK_CHARS != 0) {
        encoded.push_back('=');
    }
    return encoded;
}
}
