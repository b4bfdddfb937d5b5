#include "lxid/identity/identity_generator.hpp"
#include "lxid/crypto/sodium_interop.hpp"
namespace lxid::identity {
    using crypto::SodiumInterop;

    Result<IdentitySecret, IdentityFailure> IdentityGenerator::Generate() {
        IdentitySecret::Bytes random_bytes{};
        auto fill_result = GenerateInto(random_bytes);
        if (fill_result.IsErr()) {
            return Result<IdentitySecret, IdentityFailure>::Err(std::move(fill_result).UnwrapErr());
        }
        auto secret_result = IdentitySecret::FromBytes(random_bytes);
        return SodiumInterop::SecureWipe(random_bytes)
            .MapErr(IdentityFailure::FromSodiumFailure)
            .Bind([&secret_result](Unit) { return std::move(secret_result); });
    }

    Result<Unit, IdentityFailure> IdentityGenerator::GenerateInto(IdentitySecret::Bytes& bytes) {
        return SodiumInterop::Initialize()
            .MapErr(IdentityFailure::FromSodiumFailure)
            .Bind([&bytes](Unit) {
                SodiumInterop::FillRandom(bytes);
                ClampX25519Scalar(std::span<uint8_t>(bytes).first(Constants::X_25519_PRIVATE_KEY_SIZE));
                return Result<Unit, IdentityFailure>::Ok(unit);
            });
    }

    void IdentityGenerator::ClampX25519Scalar(std::span<uint8_t> scalar) noexcept {
        if (scalar.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
            return;
        }
        scalar[0] &= X25519Clamp::BYTE_0_MASK;
        scalar[31] &= X25519Clamp::BYTE_31_MASK;
        scalar[31] |= X25519Clamp::BYTE_31_SET;
    }
}
