#pragma once
#include "lxid/core/result.hpp"
#include "lxid/core/option.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/identity/derived_identity.hpp"
#include "lxid/identity/identity_secret.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
namespace lxid::identity {
struct LoadedIdentity {
    IdentitySecret secret;
    size_t file_size;
};

/// Binary identity files (64 raw bytes) and their ".txt" companions.
class IdentityFile {
public:
    /**
     * @brief Reads a binary identity file
     *
     * Missing file -> FileNotFound; not a regular file -> ReadFailed;
     * size != 64 -> InvalidLength naming the expected and actual size. The
     * size is taken from the filesystem, so an oversized file is never read.
     */
    [[nodiscard]] static Result<LoadedIdentity, IdentityFailure> Read(
        const std::filesystem::path& path);

    /// Size reported by the filesystem; None if it cannot be determined.
    [[nodiscard]] static Option<std::uintmax_t> FileSize(const std::filesystem::path& path);

    [[nodiscard]] static Result<Unit, IdentityFailure> Write(
        const std::filesystem::path& path,
        const IdentitySecret& secret);

    /// Path of the companion file: the identity path with the suffix appended.
    [[nodiscard]] static std::filesystem::path CompanionPath(
        const std::filesystem::path& path,
        std::string_view suffix);

    /// None if the companion file does not exist; ReadFailed if it is not a regular file.
    [[nodiscard]] static Result<Option<std::string>, IdentityFailure> ReadCompanionText(
        const std::filesystem::path& path,
        std::string_view suffix);

    [[nodiscard]] static Result<Unit, IdentityFailure> WriteCompanionText(
        const std::filesystem::path& path,
        std::string_view suffix,
        const IdentitySecret& secret,
        const DerivedIdentity& derived);

    /// Writes the binary identity and its companion text.
    [[nodiscard]] static Result<Unit, IdentityFailure> Save(
        const std::filesystem::path& path,
        const IdentitySecret& secret,
        const DerivedIdentity& derived);
private:
    IdentityFile() = delete;
};
}
