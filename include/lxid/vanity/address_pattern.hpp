#pragma once
#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/identity/identity_types.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
namespace lxid::vanity {
/// Hex prefix and/or postfix an address must show, compared nibble by nibble.
class AddressPattern {
public:
    /**
     * @brief Validates and normalizes the two patterns
     *
     * Each pattern is empty or 1-32 hex digits (any case). At least one must be
     * given. Errors are InvalidInput.
     */
    [[nodiscard]] static Result<AddressPattern, IdentityFailure> Parse(
        std::string_view prefix,
        std::string_view postfix);

    [[nodiscard]] bool Matches(const identity::Address& address) const noexcept;

    /// Lowercase form of the patterns as given.
    [[nodiscard]] const std::string& Prefix() const noexcept { return prefix_; }
    [[nodiscard]] const std::string& Postfix() const noexcept { return postfix_; }
private:
    AddressPattern(std::string prefix, std::string postfix);

    static uint8_t NibbleAt(const identity::Address& address, size_t index) noexcept;

    std::string prefix_;
    std::string postfix_;
    std::vector<uint8_t> prefix_nibbles_;
    std::vector<uint8_t> postfix_nibbles_;
};
}
