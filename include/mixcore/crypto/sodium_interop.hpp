#pragma once

#include "mixcore/core/result.hpp"
#include "mixcore/core/failures.hpp"
#include "mixcore/core/constants.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>

namespace mixcore::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Owns library initialisation and the memory primitives every secret type
 * in mixcore is built on: guarded allocation, wiping and constant-time
 * comparison.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other mixcore operation.
     * Thread-safe and idempotent.
     *
     * @return Ok if initialization succeeded, Err otherwise
     */
    static Result<Unit, SodiumFailure> Initialize();

    /**
     * @brief Check if libsodium is initialized
     */
    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Zero a buffer in a way the compiler cannot elide
     */
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without inspecting
     * their contents. Equal-length buffers are compared without an early
     * exit on the first differing byte.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    /**
     * @brief Check whether every byte of a buffer is zero, in constant time
     */
    static bool IsAllZero(std::span<const uint8_t> buffer) noexcept;

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guarded memory using sodium_malloc
     *
     * The region is surrounded by guard pages, locked against swapping
     * and wiped when released through FreeSecure.
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace mixcore::crypto
