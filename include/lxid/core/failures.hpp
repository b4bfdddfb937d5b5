#pragma once
#include <string>
#include <utility>
namespace lxid {

/// Failures raised by the libsodium layer before anything identity specific runs.
enum class SodiumFailureType {
    InitializationFailed,
    NotInitialized,
    AllocationFailed,
    InvalidOperation,
    BufferTooSmall
};

enum class IdentityFailureType {
    Generic,
    Usage,
    FileNotFound,
    ReadFailed,
    WriteFailed,
    InvalidLength,
    InvalidInput,
    KeyDerivation,
    Hashing,
    Decode
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;

    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure NotInitialized(std::string msg) {
        return {SodiumFailureType::NotInitialized, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
};

/**
 * @brief Failure of any identity operation: CLI parsing, file I/O, derivation
 *
 * The type decides how a front end reports it; the message is shown verbatim.
 * InvalidLength messages always name the expected and the actual size.
 */
class IdentityFailure {
public:
    IdentityFailureType type;
    std::string message;

    IdentityFailure(const IdentityFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static IdentityFailure Generic(std::string msg) { return {IdentityFailureType::Generic, std::move(msg)}; }
    static IdentityFailure Usage(std::string msg) { return {IdentityFailureType::Usage, std::move(msg)}; }
    static IdentityFailure FileNotFound(std::string msg) { return {IdentityFailureType::FileNotFound, std::move(msg)}; }
    static IdentityFailure ReadFailed(std::string msg) { return {IdentityFailureType::ReadFailed, std::move(msg)}; }
    static IdentityFailure WriteFailed(std::string msg) { return {IdentityFailureType::WriteFailed, std::move(msg)}; }
    static IdentityFailure InvalidLength(std::string msg) { return {IdentityFailureType::InvalidLength, std::move(msg)}; }
    static IdentityFailure InvalidInput(std::string msg) { return {IdentityFailureType::InvalidInput, std::move(msg)}; }
    static IdentityFailure KeyDerivation(std::string msg) { return {IdentityFailureType::KeyDerivation, std::move(msg)}; }
    static IdentityFailure Hashing(std::string msg) { return {IdentityFailureType::Hashing, std::move(msg)}; }
    static IdentityFailure Decode(std::string msg) { return {IdentityFailureType::Decode, std::move(msg)}; }

    /// A libsodium failure has no identity-specific meaning; keep its message.
    static IdentityFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};
}
