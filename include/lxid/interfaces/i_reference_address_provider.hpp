#pragma once
#include "lxid/core/option.hpp"
#include "lxid/identity/identity_secret.hpp"
#include "lxid/identity/identity_types.hpp"
#include <string_view>
namespace lxid::interfaces {
using identity::Address;
using identity::IdentitySecret;
/// An independent implementation able to compute the LXMF delivery address
/// of a secret. None means the implementation is unavailable for this input.
class IReferenceAddressProvider {
public:
    virtual ~IReferenceAddressProvider() = default;
    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;
    [[nodiscard]] virtual Option<Address> ComputeAddress(const IdentitySecret& secret) = 0;
};
}
