#include "lxid/crypto/secure_memory_handle.hpp"
#include "lxid/crypto/sodium_interop.hpp"
#include "lxid/core/constants.hpp"

#include <algorithm>
#include <format>
#include <string>

namespace lxid::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    using R = Result<SecureMemoryHandle, SodiumFailure>;
    if (!SodiumInterop::IsInitialized()) {
        return R::Err(SodiumFailure::NotInitialized(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return R::Err(SodiumFailure::AllocationFailed("Cannot allocate zero-sized secure memory"));
    }
    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return R::Err(SodiumFailure::AllocationFailed(
            std::format("{} ({} bytes)", ErrorMessages::SECURE_ALLOCATION_FAILED, size)));
    }
    return R::Ok(SecureMemoryHandle(ptr, size));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Release();
        ptr_ = other.ptr_;
        size_ = other.size_;
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                std::format("Data exceeds secure buffer (data: {}, buffer: {})", data.size(), size_)));
    }
    const auto region = MutableView();
    const auto tail = std::copy(data.begin(), data.end(), region.begin());
    std::fill(tail, region.end(), uint8_t{0});
    return Result<Unit, SodiumFailure>::Ok(unit);
}

std::span<const uint8_t> SecureMemoryHandle::View() const noexcept {
    if (IsInvalid()) {
        return {};
    }
    return {static_cast<const uint8_t*>(ptr_), size_};
}

std::span<uint8_t> SecureMemoryHandle::MutableView() noexcept {
    if (IsInvalid()) {
        return {};
    }
    return {static_cast<uint8_t*>(ptr_), size_};
}

void SecureMemoryHandle::Release() noexcept {
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

} // namespace lxid::crypto
