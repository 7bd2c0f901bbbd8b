#pragma once

#include "mixcore/interfaces/i_secure_random.hpp"
#include "mixcore/models/key_materials/signature.hpp"
#include "mixcore/models/key_materials/signing_key_pair.hpp"
#include "mixcore/models/key_materials/verifying_key.hpp"
#include "mixcore/core/result.hpp"
#include "mixcore/core/failures.hpp"

#include <cstdint>
#include <span>

namespace mixcore::crypto {

/**
 * @brief Ed25519 signatures (RFC 8032, pure variant) backed by libsodium
 *
 * Used for node and client identity keys. Signing is deterministic.
 * Verification is strict: non-canonical scalars, small-order components and
 * any mismatch all fail with CryptoFailure::VerificationFailed().
 */
class Ed25519 {
public:
    [[nodiscard]] static Result<models::SigningKeyPair, CryptoFailure> GenerateKeyPair(
        interfaces::ISecureRandom& random);

    /// @return Err(InvalidLength) unless seed is exactly 32 bytes
    [[nodiscard]] static Result<models::SigningKeyPair, CryptoFailure> FromSeed(
        std::span<const uint8_t> seed);

    [[nodiscard]] static Result<models::Signature, CryptoFailure> Sign(
        const models::SigningKeyPair& key_pair,
        std::span<const uint8_t> message);

    [[nodiscard]] static Result<Unit, CryptoFailure> Verify(
        const models::VerifyingKey& verifying_key,
        std::span<const uint8_t> message,
        const models::Signature& signature);

private:
    Ed25519() = delete;
};

} // namespace mixcore::crypto
