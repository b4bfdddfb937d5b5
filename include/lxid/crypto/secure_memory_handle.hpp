#pragma once

#include "lxid/core/result.hpp"
#include "lxid/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace lxid::crypto {

/**
 * @brief Owning handle to a sodium_malloc region
 *
 * The region is guarded and locked out of swap. sodium_free zeroes it when
 * the handle is destroyed. Move-only; a default constructed or moved-from
 * handle is invalid and views as an empty span.
 *
 * @code
 * auto handle = SecureMemoryHandle::Allocate(64);
 * if (handle.IsOk()) {
 *     auto write_result = handle.Unwrap().Write(secret_bytes);
 * }
 * @endcode
 */
class SecureMemoryHandle {
public:
    /// Fails before SodiumInterop::Initialize() and for size 0.
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}
    ~SecureMemoryHandle();

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /// Copies data to the start of the region and zeroes the rest.
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    [[nodiscard]] std::span<const uint8_t> View() const noexcept;
    [[nodiscard]] std::span<uint8_t> MutableView() noexcept;

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace lxid::crypto
