#pragma once
#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/identity/identity_types.hpp"
#include <string>
#include <string_view>
#include <vector>
namespace lxid::identity {
/// Destination name in Reticulum form: app name followed by dot-separated
/// aspects, e.g. "lxmf.delivery".
class DestinationName {
public:
    [[nodiscard]] static Result<DestinationName, IdentityFailure> Create(
        std::string_view app_name,
        const std::vector<std::string>& aspects);

    [[nodiscard]] static DestinationName LxmfDelivery();

    [[nodiscard]] const std::string& FullName() const noexcept {
        return full_name_;
    }

    /// SHA256(full name) truncated to the first 10 bytes.
    [[nodiscard]] NameHash ComputeNameHash() const;

    [[nodiscard]] bool operator==(const DestinationName&) const = default;
private:
    explicit DestinationName(std::string full_name);

    std::string full_name_;
};
}
