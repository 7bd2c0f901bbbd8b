#pragma once
#include "mixcore/crypto/sodium_secure_memory_handle.hpp"
#include "mixcore/core/constants.hpp"
#include "mixcore/core/failures.hpp"
#include "mixcore/core/result.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <span>

namespace mixcore::crypto {

/**
 * @brief Initial AES-CTR counter block
 *
 * Cannot be built from caller-chosen bytes. The only sources are a
 * NonceSequence and ForSingleUseKey().
 */
class CtrNonce {
public:
    using Bytes = std::array<uint8_t, Constants::CTR_NONCE_SIZE>;

    /// All-zero block. Only valid with a key that encrypts exactly one message.
    [[nodiscard]] static CtrNonce ForSingleUseKey() noexcept {
        return CtrNonce(Bytes{});
    }

    [[nodiscard]] const Bytes& GetBytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept {
        return bytes_;
    }

    bool operator==(const CtrNonce&) const = default;

private:
    friend class NonceSequence;

    explicit CtrNonce(const Bytes& bytes) noexcept
        : bytes_(bytes) {
    }

    Bytes bytes_;
};

/**
 * @brief Packet-local sequence of counter blocks under one encryption key
 *
 * Block layout:
 *   [0..7]   nonce base XOR big-endian(index)
 *   [8..15]  zero, consumed by the CTR block counter
 *
 * Distinct indices differ in the high half, so their keystreams never
 * overlap for messages shorter than 2^64 blocks. Next() is safe to call
 * from several threads and fails with InvalidState instead of wrapping.
 */
class NonceSequence {
public:
    using Base = std::array<uint8_t, Constants::CTR_NONCE_BASE_SIZE>;

    /// @param base key-derivation output of exactly CTR_NONCE_BASE_SIZE bytes
    [[nodiscard]] static Result<NonceSequence, CryptoFailure> FromKeyMaterial(
        const SecureMemoryHandle& base);

    NonceSequence(NonceSequence&& other) noexcept;
    NonceSequence& operator=(NonceSequence&& other) noexcept;
    NonceSequence(const NonceSequence&) = delete;
    NonceSequence& operator=(const NonceSequence&) = delete;
    ~NonceSequence() = default;

    [[nodiscard]] Result<CtrNonce, CryptoFailure> Next();

    /**
     * @brief Counter block for an index the peer already used
     *
     * Receiving side only. Does not advance the sequence, so encrypting
     * with the result would repeat a block Next() hands out.
     */
    [[nodiscard]] CtrNonce At(uint64_t index) const noexcept;

    [[nodiscard]] uint64_t Issued() const noexcept {
        return next_index_.load(std::memory_order_acquire);
    }

private:
    explicit NonceSequence(const Base& base) noexcept;

    Base base_;
    std::atomic<uint64_t> next_index_;
};

}
