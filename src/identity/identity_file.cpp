#include "lxid/identity/identity_file.hpp"
#include "lxid/identity/companion_text.hpp"
#include "lxid/core/constants.hpp"
#include <sodium.h>
#include <exception>
#include <format>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <system_error>
namespace lxid::identity {
namespace fs = std::filesystem;
namespace {
    Result<Unit, IdentityFailure> RequireRegularFile(const fs::path& path) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec) || ec) {
            return Result<Unit, IdentityFailure>::Err(
                IdentityFailure::ReadFailed(
                    std::format("'{}' is not a regular file", path.string())));
        }
        return Result<Unit, IdentityFailure>::Ok(unit);
    }

    /// Streams are opened with exceptions enabled; any stream failure becomes ReadFailed.
    Result<Unit, IdentityFailure> ReadInto(const fs::path& path, std::span<uint8_t> buffer) {
        try {
            std::ifstream input;
            input.exceptions(std::ios::failbit | std::ios::badbit);
            input.open(path, std::ios::binary);
            input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        } catch (const std::exception& ex) {
            sodium_memzero(buffer.data(), buffer.size());
            return Result<Unit, IdentityFailure>::Err(
                IdentityFailure::ReadFailed(
                    std::format("Failed to read '{}': {}", path.string(), ex.what())));
        }
        return Result<Unit, IdentityFailure>::Ok(unit);
    }

    Result<std::string, IdentityFailure> ReadAllText(const fs::path& path) {
        auto regular_result = RequireRegularFile(path);
        if (regular_result.IsErr()) {
            return Result<std::string, IdentityFailure>::Err(std::move(regular_result).UnwrapErr());
        }
        try {
            std::ifstream input;
            input.exceptions(std::ios::badbit);
            input.open(path, std::ios::binary);
            if (!input) {
                return Result<std::string, IdentityFailure>::Err(
                    IdentityFailure::ReadFailed(
                        std::format("Failed to open '{}' for reading", path.string())));
            }
            std::string text{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
            return Result<std::string, IdentityFailure>::Ok(std::move(text));
        } catch (const std::exception& ex) {
            return Result<std::string, IdentityFailure>::Err(
                IdentityFailure::ReadFailed(
                    std::format("Failed to read '{}': {}", path.string(), ex.what())));
        }
    }

    Result<Unit, IdentityFailure> WriteAllBytes(const fs::path& path, const char* data, const size_t size) {
        std::ofstream output(path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Result<Unit, IdentityFailure>::Err(
                IdentityFailure::WriteFailed(
                    std::format("Failed to open '{}' for writing", path.string())));
        }
        output.write(data, static_cast<std::streamsize>(size));
        output.flush();
        if (!output) {
            return Result<Unit, IdentityFailure>::Err(
                IdentityFailure::WriteFailed(
                    std::format("Failed to write '{}'", path.string())));
        }
        return Result<Unit, IdentityFailure>::Ok(unit);
    }

    bool FileExists(const fs::path& path) {
        std::error_code ec;
        return fs::exists(path, ec) && !ec;
    }
}

Result<LoadedIdentity, IdentityFailure> IdentityFile::Read(const fs::path& path) {
    using R = Result<LoadedIdentity, IdentityFailure>;
    if (!FileExists(path)) {
        return R::Err(IdentityFailure::FileNotFound(
            std::format("File '{}' not found", path.string())));
    }
    auto regular_result = RequireRegularFile(path);
    if (regular_result.IsErr()) {
        return R::Err(std::move(regular_result).UnwrapErr());
    }
    const auto size = FileSize(path);
    if (!size.has_value()) {
        return R::Err(IdentityFailure::ReadFailed(
            std::format("Failed to determine the size of '{}'", path.string())));
    }
    const auto file_size = *size;
    if (file_size != Constants::IDENTITY_SECRET_SIZE) {
        return R::Err(IdentityFailure::InvalidLength(
            std::format("Identity file must be {} bytes (private key), got {}",
                Constants::IDENTITY_SECRET_SIZE, file_size)));
    }
    IdentitySecret::Bytes bytes{};
    auto read_result = ReadInto(path, bytes);
    if (read_result.IsErr()) {
        return R::Err(std::move(read_result).UnwrapErr());
    }
    auto secret_result = IdentitySecret::FromBytes(bytes);
    sodium_memzero(bytes.data(), bytes.size());
    if (secret_result.IsErr()) {
        return R::Err(std::move(secret_result).UnwrapErr());
    }
    return R::Ok(LoadedIdentity{std::move(secret_result).Unwrap(), static_cast<size_t>(file_size)});
}

Option<std::uintmax_t> IdentityFile::FileSize(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return None<std::uintmax_t>();
    }
    return Some(size);
}

Result<Unit, IdentityFailure> IdentityFile::Write(const fs::path& path, const IdentitySecret& secret) {
    const auto bytes = secret.AsBytes();
    return WriteAllBytes(path, reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

fs::path IdentityFile::CompanionPath(const fs::path& path, std::string_view suffix) {
    fs::path companion = path;
    companion += std::string(suffix);
    return companion;
}

Result<Option<std::string>, IdentityFailure> IdentityFile::ReadCompanionText(
    const fs::path& path,
    std::string_view suffix) {
    const auto companion_path = CompanionPath(path, suffix);
    if (!FileExists(companion_path)) {
        return Result<Option<std::string>, IdentityFailure>::Ok(None<std::string>());
    }
    auto text_result = ReadAllText(companion_path);
    if (text_result.IsErr()) {
        return Result<Option<std::string>, IdentityFailure>::Err(std::move(text_result).UnwrapErr());
    }
    return Result<Option<std::string>, IdentityFailure>::Ok(Some(std::move(text_result).Unwrap()));
}

Result<Unit, IdentityFailure> IdentityFile::WriteCompanionText(
    const fs::path& path,
    std::string_view suffix,
    const IdentitySecret& secret,
    const DerivedIdentity& derived) {
    const std::string text = CompanionText::Render(secret, derived);
    return WriteAllBytes(CompanionPath(path, suffix), text.data(), text.size());
}

Result<Unit, IdentityFailure> IdentityFile::Save(
    const fs::path& path,
    const IdentitySecret& secret,
    const DerivedIdentity& derived) {
    auto write_result = Write(path, secret);
    if (write_result.IsErr()) {
        return write_result;
    }
    return WriteCompanionText(path, CompanionTextConstants::FILE_SUFFIX, secret, derived);
}
}
