#pragma once
#include <cstdint>
#include <span>
#include <string>
namespace lxid::encoding {
/// Standard Base64 alphabet with '=' padding.
[[nodiscard]] std::string ToBase64(std::span<const uint8_t> data);
/// RFC 4648 Base32, uppercase alphabet with '=' padding.
[[nodiscard]] std::string ToBase32(std::span<const uint8_t> data);
}
