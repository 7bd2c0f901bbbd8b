#pragma once
#include "mixcore/models/key_materials/secret_key.hpp"
#include "mixcore/models/tag.hpp"
#include "mixcore/core/result.hpp"
#include "mixcore/core/failures.hpp"
#include <cstdint>
#include <initializer_list>
#include <span>
namespace mixcore::crypto {

/**
 * @brief BLAKE3 keyed-hash MAC over packet headers and payloads
 *
 * Tags are 32 bytes and are compared in constant time. A mismatch is
 * always the single CryptoFailure::VerificationFailed(), whatever part of
 * the input differs.
 */
class IntegrityTag {
public:
    [[nodiscard]] static Result<models::Tag, CryptoFailure> Compute(
        const models::MacKey& key,
        std::span<const uint8_t> message);

    /**
     * @brief Tag several parts as one message
     *
     * Each part is preceded by its length as 8 little-endian bytes, so
     * moving bytes from one part to the next changes the tag.
     */
    [[nodiscard]] static Result<models::Tag, CryptoFailure> Compute(
        const models::MacKey& key,
        std::initializer_list<std::span<const uint8_t>> parts);

    /// False on any mismatch and on a key that cannot be read.
    [[nodiscard]] static bool Verify(
        const models::MacKey& key,
        std::span<const uint8_t> message,
        const models::Tag& expected);

    [[nodiscard]] static Result<Unit, CryptoFailure> VerifyOrFail(
        const models::MacKey& key,
        std::span<const uint8_t> message,
        const models::Tag& expected);

    [[nodiscard]] static Result<Unit, CryptoFailure> VerifyOrFail(
        const models::MacKey& key,
        std::initializer_list<std::span<const uint8_t>> parts,
        const models::Tag& expected);

private:
    IntegrityTag() = delete;
};

/// Replay identifiers, keyed under a different role than the MAC.
class ReplayTag {
public:
    [[nodiscard]] static Result<models::ReplayId, CryptoFailure> Derive(
        const models::ReplayKey& key,
        std::span<const uint8_t> message);

private:
    ReplayTag() = delete;
};

}
