#include "mixcore/crypto/nonce_sequence.hpp"
#include <fmt/core.h>
#include <limits>

namespace mixcore::crypto {

namespace {
    constexpr uint64_t EXHAUSTED_INDEX = std::numeric_limits<uint64_t>::max();
    static_assert(Constants::CTR_NONCE_BASE_SIZE == sizeof(uint64_t),
        "Nonce base must cover one 64-bit index");
}

NonceSequence::NonceSequence(const Base& base) noexcept
    : base_(base)
    , next_index_(0) {
}

NonceSequence::NonceSequence(NonceSequence&& other) noexcept
    : base_(other.base_)
    , next_index_(other.next_index_.load(std::memory_order_acquire)) {
    // a moved-from sequence must not hand out the same blocks again
    other.next_index_.store(EXHAUSTED_INDEX, std::memory_order_release);
}

NonceSequence& NonceSequence::operator=(NonceSequence&& other) noexcept {
    if (this != &other) {
        base_ = other.base_;
        next_index_.store(other.next_index_.load(std::memory_order_acquire),
            std::memory_order_release);
        other.next_index_.store(EXHAUSTED_INDEX, std::memory_order_release);
    }
    return *this;
}

Result<NonceSequence, CryptoFailure> NonceSequence::FromKeyMaterial(
    const SecureMemoryHandle& base) {
    if (base.Size() != Constants::CTR_NONCE_BASE_SIZE) {
        return Result<NonceSequence, CryptoFailure>::Err(
            CryptoFailure::InvalidLength(
                fmt::format("Nonce base must be {} bytes, got {}",
                    Constants::CTR_NONCE_BASE_SIZE, base.Size())));
    }
    Base bytes{};
    auto read_result = base.Read(bytes);
    if (read_result.IsErr()) {
        return Result<NonceSequence, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    return Result<NonceSequence, CryptoFailure>::Ok(NonceSequence(bytes));
}

Result<CtrNonce, CryptoFailure> NonceSequence::Next() {
    uint64_t index = next_index_.load(std::memory_order_relaxed);
    do {
        if (index == EXHAUSTED_INDEX) {
            return Result<CtrNonce, CryptoFailure>::Err(
                CryptoFailure::InvalidState(
                    std::string(ErrorMessages::NONCE_SEQUENCE_EXHAUSTED)));
        }
    } while (!next_index_.compare_exchange_weak(
        index, index + 1, std::memory_order_acq_rel, std::memory_order_relaxed));

    return Result<CtrNonce, CryptoFailure>::Ok(At(index));
}

CtrNonce NonceSequence::At(const uint64_t index) const noexcept {
    CtrNonce::Bytes block{};
    for (size_t i = 0; i < Constants::CTR_NONCE_BASE_SIZE; ++i) {
        const auto shift = static_cast<unsigned>((Constants::CTR_NONCE_BASE_SIZE - 1 - i) * 8);
        block[i] = static_cast<uint8_t>(base_[i] ^ static_cast<uint8_t>((index >> shift) & 0xFF));
    }
    return CtrNonce(block);
}

}
