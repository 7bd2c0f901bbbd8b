#pragma once

#include "mixcore/core/result.hpp"
#include "mixcore/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>

namespace mixcore::crypto {

/**
 * @brief RAII owner of one libsodium guarded allocation
 *
 * Every secret in mixcore (private scalars, shared secrets, derived
 * sub-keys, signing keys) lives in exactly one of these. The memory is
 * guard-paged, locked against swapping and zeroed by sodium_free when the
 * handle is destroyed or overwritten by a move, on every return path.
 *
 * Secret bytes are reached through WithReadAccess / WithWriteAccess so they
 * never need to be copied into ordinary heap buffers.
 *
 * Example:
 * @code
 * auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
 * handle.WithWriteAccess([&](std::span<uint8_t> bytes) {
 *     // fill bytes
 *     return unit;
 * });
 * @endcode
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    ~SecureMemoryHandle();

    /// Creates an invalid handle. Useful for containers.
    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Copy data into the handle, zero-filling any remaining bytes
     *
     * @return Err if the data is larger than the allocation or the handle
     *         has been moved from
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Copy the full contents out
     *
     * The caller owns the copy and must wipe it.
     */
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    /**
     * @brief Run `func` with a read-only view of the secure memory
     */
    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    /**
     * @brief Run `func` with a writable view of the secure memory
     */
    template<typename F>
    auto WithWriteAccess(F&& func)
        -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<uint8_t> secure_span(
            static_cast<uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

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

/**
 * @brief Collapse the result of an access callback that itself returns a
 *        Result<T, CryptoFailure>
 */
template<typename T>
[[nodiscard]] Result<T, CryptoFailure> FlattenAccess(
    Result<Result<T, CryptoFailure>, SodiumFailure>&& access_result) {
    if (access_result.IsErr()) {
        return Result<T, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(access_result.UnwrapErr()));
    }
    return std::move(access_result).Unwrap();
}

} // namespace mixcore::crypto
