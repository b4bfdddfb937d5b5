#pragma once
#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace lxid::encoding {
/// Lowercase hex, two characters per byte.
[[nodiscard]] std::string ToHex(std::span<const uint8_t> data);
/// Accepts upper and lower case digits; rejects odd lengths and non-hex characters.
[[nodiscard]] Result<std::vector<uint8_t>, IdentityFailure> FromHex(std::string_view text);
[[nodiscard]] bool IsHexDigit(char c) noexcept;
[[nodiscard]] bool IsHex(std::string_view text) noexcept;
/// Value of a single hex digit (0-15). Caller must check IsHexDigit first.
[[nodiscard]] uint8_t HexDigitValue(char c) noexcept;
}
