#include "lxid/identity/destination_name.hpp"
#include "lxid/crypto/sodium_interop.hpp"
#include <algorithm>
#include <format>
namespace lxid::identity {
    using crypto::SodiumInterop;

    Result<DestinationName, IdentityFailure> DestinationName::Create(
        std::string_view app_name,
        const std::vector<std::string>& aspects) {
        if (app_name.empty()) {
            return Result<DestinationName, IdentityFailure>::Err(
                IdentityFailure::InvalidInput("Destination app name cannot be empty"));
        }
        if (app_name.find(DestinationConstants::ASPECT_SEPARATOR) != std::string_view::npos) {
            return Result<DestinationName, IdentityFailure>::Err(
                IdentityFailure::InvalidInput(
                    std::format("Dots can't be used in app names: '{}'", app_name)));
        }
        std::string full_name(app_name);
        for (const auto& aspect : aspects) {
            if (aspect.find(DestinationConstants::ASPECT_SEPARATOR) != std::string::npos) {
                return Result<DestinationName, IdentityFailure>::Err(
                    IdentityFailure::InvalidInput(
                        std::format("Dots can't be used in aspects: '{}'", aspect)));
            }
            full_name.push_back(DestinationConstants::ASPECT_SEPARATOR);
            full_name += aspect;
        }
        return Result<DestinationName, IdentityFailure>::Ok(DestinationName(std::move(full_name)));
    }

    DestinationName DestinationName::LxmfDelivery() {
        return DestinationName(std::string(DestinationConstants::LXMF_DELIVERY_NAME));
    }

    NameHash DestinationName::ComputeNameHash() const {
        const auto digest = SodiumInterop::Sha256(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(full_name_.data()), full_name_.size()));
        NameHash name_hash{};
        std::copy_n(digest.begin(), name_hash.size(), name_hash.begin());
        return name_hash;
    }

    DestinationName::DestinationName(std::string full_name)
        : full_name_(std::move(full_name)) {
    }
}
