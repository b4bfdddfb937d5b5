/**
 * @file derive_address_example.cpp
 * @brief Generates an identity, derives its LXMF address and cross-checks it with OpenSSL
 */

#include "lxid/crypto/sodium_interop.hpp"
#include "lxid/encoding/base_encoding.hpp"
#include "lxid/encoding/hex.hpp"
#include "lxid/identity/address_deriver.hpp"
#include "lxid/identity/identity_generator.hpp"
#include "lxid/verification/openssl_reference_provider.hpp"

#include <iostream>
#include <span>
#include <string>

using namespace lxid;
using namespace lxid::identity;

void print_hex(const std::string& label, std::span<const uint8_t> data) {
    std::cout << label << ": " << encoding::ToHex(data) << std::endl;
}

int main() {
    std::cout << "=== LXMF Identity - Address Derivation Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Generating a random identity..." << std::endl;
    auto secret_result = IdentityGenerator::Generate();
    if (secret_result.IsErr()) {
        std::cerr << "Failed to generate identity: "
                  << secret_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto secret = std::move(secret_result).Unwrap();
    std::cout << "   ✓ Generated 64-byte identity (X25519 private + Ed25519 seed)" << std::endl;
    std::cout << "   Private key: [not printed]" << std::endl;
    std::cout << std::endl;

    std::cout << "3. Deriving public keys and LXMF address..." << std::endl;
    auto derive_result = AddressDeriver::Derive(secret);
    if (derive_result.IsErr()) {
        std::cerr << "Failed to derive address: "
                  << derive_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& derived = derive_result.Unwrap();
    print_hex("   X25519 public", derived.X25519Public());
    print_hex("   Ed25519 public", derived.Ed25519Public());
    print_hex("   Identity hash", derived.identity_hash);
    print_hex("   LXMF address", derived.address);
    std::cout << std::endl;

    std::cout << "4. Cross-checking with OpenSSL..." << std::endl;
    auto reference_result = verification::OpenSslReferenceProvider::Compute(secret);
    if (reference_result.IsErr()) {
        std::cout << "   OpenSSL unavailable: "
                  << reference_result.UnwrapErr().message << std::endl;
    } else {
        const bool match = reference_result.Unwrap() == derived.address;
        std::cout << "   OpenSSL address matches: " << (match ? "true" : "false") << std::endl;
    }
    std::cout << std::endl;

    std::cout << "5. Import strings for other clients..." << std::endl;
    std::cout << "   Base64 length: " << encoding::ToBase64(secret.AsBytes()).size() << std::endl;
    std::cout << "   Base32 length: " << encoding::ToBase32(secret.AsBytes()).size() << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    std::cout << std::endl;
    std::cout << "Note: The identity secret is wiped when it goes out of scope (RAII)." << std::endl;

    return 0;
}
