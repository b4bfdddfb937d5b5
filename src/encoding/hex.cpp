#include "lxid/encoding/hex.hpp"
#include <sodium.h>
#include <algorithm>
#include <format>
namespace lxid::encoding {
std::string ToHex(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}
Result<std::vector<uint8_t>, IdentityFailure> FromHex(std::string_view text) {
    if (text.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, IdentityFailure>::Err(
            IdentityFailure::Decode(
                std::format("Hex string must have an even length, got {}", text.size())));
    }
    if (!IsHex(text)) {
        return Result<std::vector<uint8_t>, IdentityFailure>::Err(
            IdentityFailure::Decode("Hex string contains non-hex characters"));
    }
    std::vector<uint8_t> bytes(text.size() / 2);
    if (bytes.empty()) {
        return Result<std::vector<uint8_t>, IdentityFailure>::Ok(std::move(bytes));
    }
    size_t bin_len = 0;
    if (sodium_hex2bin(bytes.data(), bytes.size(), text.data(), text.size(),
                       nullptr, &bin_len, nullptr) != 0 || bin_len != bytes.size()) {
        return Result<std::vector<uint8_t>, IdentityFailure>::Err(
            IdentityFailure::Decode("Failed to decode hex string"));
    }
    return Result<std::vector<uint8_t>, IdentityFailure>::Ok(std::move(bytes));
}
bool IsHexDigit(const char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}
bool IsHex(std::string_view text) noexcept {
    return std::all_of(text.begin(), text.end(), IsHexDigit);
}
uint8_t HexDigitValue(const char c) noexcept {
    if (c >= '0' && c <= '9') {
        return static_cast<uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<uint8_t>(c - 'a' + 10);
    }
    return static_cast<uint8_t>(c - 'A' + 10);
}
}
