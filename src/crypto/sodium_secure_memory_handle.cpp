#include "mixcore/crypto/sodium_secure_memory_handle.hpp"
#include "mixcore/crypto/sodium_interop.hpp"
#include "mixcore/core/constants.hpp"

#include <fmt/core.h>

#include <cstring>

namespace mixcore::crypto {

// ============================================================================
// Construction / Destruction
// ============================================================================

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                "Cannot allocate zero-sized secure memory"));
    }

    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                fmt::format("{}{} bytes",
                    ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }

    return Result<SecureMemoryHandle, SodiumFailure>::Ok(
        SecureMemoryHandle(ptr, size));
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

void SecureMemoryHandle::Release() noexcept {
    if (ptr_ != nullptr) {
        // sodium_free zeroes the region before unmapping it
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

// ============================================================================
// Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                fmt::format("{} (data: {}, buffer: {})",
                    ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }

    if (!data.empty()) {
        std::memcpy(ptr_, data.data(), data.size());
    }
    if (data.size() < size_) {
        std::memset(static_cast<uint8_t*>(ptr_) + data.size(), 0, size_ - data.size());
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                fmt::format("Output buffer too small (requested: {}, provided: {})",
                    size_, output.size())));
    }

    std::memcpy(output.data(), ptr_, size_);
    return Result<Unit, SodiumFailure>::Ok(unit);
}

} // namespace mixcore::crypto
