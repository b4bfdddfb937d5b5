#include "lxid/vanity/address_pattern.hpp"
#include "lxid/core/constants.hpp"
#include "lxid/encoding/hex.hpp"
#include <algorithm>
#include <cctype>
#include <format>
namespace lxid::vanity {
    namespace {
        Result<std::string, IdentityFailure> Normalize(std::string_view pattern, std::string_view label) {
            if (pattern.size() > VanityConstants::MAX_PATTERN_LENGTH) {
                return Result<std::string, IdentityFailure>::Err(
                    IdentityFailure::InvalidInput(
                        std::format("{} must be 1-{} hex characters", label, VanityConstants::MAX_PATTERN_LENGTH)));
            }
            if (!encoding::IsHex(pattern)) {
                return Result<std::string, IdentityFailure>::Err(
                    IdentityFailure::InvalidInput(
                        std::format("{} must contain only hex characters [0-9a-fA-F]", label)));
            }
            std::string lowered(pattern);
            std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return Result<std::string, IdentityFailure>::Ok(std::move(lowered));
        }

        std::vector<uint8_t> ToNibbles(const std::string& pattern) {
            std::vector<uint8_t> nibbles;
            nibbles.reserve(pattern.size());
            for (const char c : pattern) {
                nibbles.push_back(encoding::HexDigitValue(c));
            }
            return nibbles;
        }
    }

    Result<AddressPattern, IdentityFailure> AddressPattern::Parse(
        std::string_view prefix,
        std::string_view postfix) {
        auto prefix_result = Normalize(prefix, "prefix");
        if (prefix_result.IsErr()) {
            return Result<AddressPattern, IdentityFailure>::Err(std::move(prefix_result).UnwrapErr());
        }
        auto postfix_result = Normalize(postfix, "postfix");
        if (postfix_result.IsErr()) {
            return Result<AddressPattern, IdentityFailure>::Err(std::move(postfix_result).UnwrapErr());
        }
        if (prefix.empty() && postfix.empty()) {
            return Result<AddressPattern, IdentityFailure>::Err(
                IdentityFailure::InvalidInput("at least one of --prefix or --postfix must be specified"));
        }
        return Result<AddressPattern, IdentityFailure>::Ok(AddressPattern(
            std::move(prefix_result).Unwrap(),
            std::move(postfix_result).Unwrap()));
    }

    bool AddressPattern::Matches(const identity::Address& address) const noexcept {
        for (size_t i = 0; i < prefix_nibbles_.size(); ++i) {
            if (NibbleAt(address, i) != prefix_nibbles_[i]) {
                return false;
            }
        }
        const size_t postfix_start = Constants::ADDRESS_NIBBLE_COUNT - postfix_nibbles_.size();
        for (size_t i = 0; i < postfix_nibbles_.size(); ++i) {
            if (NibbleAt(address, postfix_start + i) != postfix_nibbles_[i]) {
                return false;
            }
        }
        return true;
    }

    AddressPattern::AddressPattern(std::string prefix, std::string postfix)
        : prefix_(std::move(prefix))
        , postfix_(std::move(postfix))
        , prefix_nibbles_(ToNibbles(prefix_))
        , postfix_nibbles_(ToNibbles(postfix_)) {
    }

    uint8_t AddressPattern::NibbleAt(const identity::Address& address, const size_t index) noexcept {
        const uint8_t byte = address[index / 2];
        return index % 2 == 0 ? static_cast<uint8_t>((byte >> 4) & 0x0F) : static_cast<uint8_t>(byte & 0x0F);
    }
}
