#pragma once
#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/identity/identity_secret.hpp"
#include <span>
namespace lxid::identity {
class IdentityGenerator {
public:
    /// Fresh random identity. The X25519 half is stored clamped.
    [[nodiscard]] static Result<IdentitySecret, IdentityFailure> Generate();

    /// Same key material as Generate(), written into a caller-owned buffer.
    /// The caller wipes it.
    [[nodiscard]] static Result<Unit, IdentityFailure> GenerateInto(IdentitySecret::Bytes& bytes);

    /// Clamps an X25519 scalar in place (RFC 7748 decodeScalar25519).
    static void ClampX25519Scalar(std::span<uint8_t> scalar) noexcept;
private:
    IdentityGenerator() = delete;
};
}
