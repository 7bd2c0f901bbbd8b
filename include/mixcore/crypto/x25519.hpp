#pragma once

#include "mixcore/interfaces/i_secure_random.hpp"
#include "mixcore/models/key_materials/public_point.hpp"
#include "mixcore/models/key_materials/secret_key.hpp"
#include "mixcore/models/key_materials/x25519_key_pair.hpp"
#include "mixcore/core/result.hpp"
#include "mixcore/core/failures.hpp"

namespace mixcore::crypto {

/**
 * @brief X25519 key agreement (RFC 7748) backed by libsodium
 *
 * Peer points are validated before use. Small-order and non-canonical
 * values, and an all-zero shared secret, fail with
 * CryptoFailureType::KeyExchange instead of producing a predictable secret.
 */
class X25519 {
public:
    /**
     * @brief Generate a fresh key pair
     *
     * The private scalar is drawn from `random` straight into secure memory.
     *
     * @return Err(RandomSourceFailure) if the random source fails
     */
    [[nodiscard]] static Result<models::X25519KeyPair, CryptoFailure> GenerateKeyPair(
        interfaces::ISecureRandom& random);

    [[nodiscard]] static Result<models::PublicPoint, CryptoFailure> DerivePublicPoint(
        const models::PrivateScalar& private_scalar);

    /// Deterministic for fixed inputs; both sides of an exchange get the same secret.
    [[nodiscard]] static Result<models::SharedSecret, CryptoFailure> DiffieHellman(
        const models::PrivateScalar& private_scalar,
        const models::PublicPoint& peer_public);

    /**
     * @brief Re-randomise a group element with a hop's blinding factor
     *
     * Computes blinding_factor * point. Used to derive the next hop's
     * group element from the current one.
     */
    [[nodiscard]] static Result<models::PublicPoint, CryptoFailure> BlindPublicPoint(
        const models::PublicPoint& point,
        const models::BlindingFactor& blinding_factor);

private:
    X25519() = delete;
};

} // namespace mixcore::crypto
