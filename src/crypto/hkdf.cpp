#include "mixcore/crypto/hkdf.hpp"
#include "mixcore/crypto/sodium_interop.hpp"

#include <blake3.h>
#include <fmt/core.h>
#include <sodium.h>

#include <algorithm>
#include <array>

namespace mixcore::crypto {

namespace {
    constexpr uint8_t INNER_PAD = 0x36;
    constexpr uint8_t OUTER_PAD = 0x5c;

    static_assert(BLAKE3_OUT_LEN == Constants::BLAKE3_OUT_SIZE, "BLAKE3 output width mismatch");
    static_assert(BLAKE3_BLOCK_LEN == Constants::BLAKE3_BLOCK_SIZE, "BLAKE3 block width mismatch");

    /// HMAC (RFC 2104) over the unkeyed BLAKE3 hash. Wipes all key-dependent
    /// state when it goes out of scope.
    class HmacBlake3 {
    public:
        explicit HmacBlake3(std::span<const uint8_t> key) noexcept {
            std::array<uint8_t, Constants::BLAKE3_BLOCK_SIZE> key_block{};
            if (key.size() > key_block.size()) {
                blake3_hasher key_hasher;
                blake3_hasher_init(&key_hasher);
                blake3_hasher_update(&key_hasher, key.data(), key.size());
                blake3_hasher_finalize(&key_hasher, key_block.data(), BLAKE3_OUT_LEN);
                sodium_memzero(&key_hasher, sizeof(key_hasher));
            } else {
                std::copy(key.begin(), key.end(), key_block.begin());
            }

            std::array<uint8_t, Constants::BLAKE3_BLOCK_SIZE> inner_pad{};
            for (size_t i = 0; i < key_block.size(); ++i) {
                inner_pad[i] = static_cast<uint8_t>(key_block[i] ^ INNER_PAD);
                outer_pad_[i] = static_cast<uint8_t>(key_block[i] ^ OUTER_PAD);
            }
            blake3_hasher_init(&inner_);
            blake3_hasher_update(&inner_, inner_pad.data(), inner_pad.size());

            SodiumInterop::SecureWipe(key_block);
            SodiumInterop::SecureWipe(inner_pad);
        }

        ~HmacBlake3() {
            sodium_memzero(&inner_, sizeof(inner_));
            SodiumInterop::SecureWipe(outer_pad_);
        }

        HmacBlake3(const HmacBlake3&) = delete;
        HmacBlake3& operator=(const HmacBlake3&) = delete;

        void Update(std::span<const uint8_t> data) noexcept {
            if (!data.empty()) {
                blake3_hasher_update(&inner_, data.data(), data.size());
            }
        }

        void Finalize(std::span<uint8_t, Constants::BLAKE3_OUT_SIZE> output) noexcept {
            std::array<uint8_t, Constants::BLAKE3_OUT_SIZE> inner_digest{};
            blake3_hasher_finalize(&inner_, inner_digest.data(), inner_digest.size());

            blake3_hasher outer;
            blake3_hasher_init(&outer);
            blake3_hasher_update(&outer, outer_pad_.data(), outer_pad_.size());
            blake3_hasher_update(&outer, inner_digest.data(), inner_digest.size());
            blake3_hasher_finalize(&outer, output.data(), output.size());

            sodium_memzero(&outer, sizeof(outer));
            SodiumInterop::SecureWipe(inner_digest);
        }

    private:
        blake3_hasher inner_{};
        std::array<uint8_t, Constants::BLAKE3_BLOCK_SIZE> outer_pad_{};
    };
}

Result<Unit, CryptoFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    auto prk_result = Extract(ikm, salt);
    if (prk_result.IsErr()) {
        return Result<Unit, CryptoFailure>::Err(std::move(prk_result).UnwrapErr());
    }
    const auto prk = std::move(prk_result).Unwrap();

    return FlattenAccess(prk.WithReadAccess([&](std::span<const uint8_t> prk_bytes) {
        return Expand(prk_bytes, output, info);
    }));
}

Result<SecureMemoryHandle, CryptoFailure> Hkdf::Extract(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt) {

    auto prk_result = SecureMemoryHandle::Allocate(HASH_LEN);
    if (prk_result.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(prk_result.UnwrapErr()));
    }
    auto prk = std::move(prk_result).Unwrap();

    // RFC 5869: an absent salt is HashLen zero bytes
    const std::array<uint8_t, HASH_LEN> zero_salt{};
    const std::span<const uint8_t> effective_salt = salt.empty()
        ? std::span<const uint8_t>(zero_salt)
        : salt;

    auto write_result = prk.WithWriteAccess([&](std::span<uint8_t> prk_bytes) {
        HmacBlake3 hmac(effective_salt);
        hmac.Update(ikm);
        hmac.Finalize(prk_bytes.first<HASH_LEN>());
        return unit;
    });
    if (write_result.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return Result<SecureMemoryHandle, CryptoFailure>::Ok(std::move(prk));
}

Result<Unit, CryptoFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    std::span<uint8_t> output,
    std::span<const uint8_t> info) {

    if (prk.size() != HASH_LEN) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidLength(
                fmt::format("PRK must be exactly {} bytes, got {}", HASH_LEN, prk.size())));
    }
    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidLength(
                fmt::format("HKDF output length must be in [1, {}], got {}",
                    MAX_OUTPUT_LEN, output.size())));
    }

    const size_t blocks = (output.size() + HASH_LEN - 1) / HASH_LEN;
    std::array<uint8_t, HASH_LEN> previous{};
    size_t previous_len = 0;
    size_t output_pos = 0;

    for (size_t i = 1; i <= blocks; ++i) {
        // T(i) = HMAC(PRK, T(i-1) || info || i)
        HmacBlake3 hmac(prk);
        hmac.Update(std::span<const uint8_t>(previous.data(), previous_len));
        hmac.Update(info);
        const uint8_t counter = static_cast<uint8_t>(i);
        hmac.Update(std::span<const uint8_t>(&counter, 1));
        hmac.Finalize(previous);
        previous_len = HASH_LEN;

        const size_t to_copy = std::min(HASH_LEN, output.size() - output_pos);
        std::copy_n(previous.begin(), to_copy, output.begin() + static_cast<std::ptrdiff_t>(output_pos));
        output_pos += to_copy;
    }

    SodiumInterop::SecureWipe(previous);
    return Result<Unit, CryptoFailure>::Ok(unit);
}

} // namespace mixcore::crypto
