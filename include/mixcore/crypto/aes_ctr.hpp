#pragma once
#include "mixcore/crypto/nonce_sequence.hpp"
#include "mixcore/models/key_materials/secret_key.hpp"
#include "mixcore/core/result.hpp"
#include "mixcore/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace mixcore::crypto {

/**
 * AES in counter mode (AES-128-CTR or AES-256-CTR, chosen by key width)
 *
 * Unauthenticated and length preserving. Every header or payload layer
 * transformed here is covered by an IntegrityTag computed under a separate
 * MacKey.
 *
 * The counter block is a CtrNonce, which only a NonceSequence or
 * CtrNonce::ForSingleUseKey() can produce. Reusing a (key, nonce) pair
 * reveals the XOR of the two plaintexts, so the encrypting side takes its
 * blocks from NonceSequence::Next() only. NonceSequence::At() rebuilds a
 * block the peer already used and is for the decrypting side.
 * ForSingleUseKey() is only for keys that encrypt exactly one message.
 *
 * Encrypt and Decrypt are the same keystream XOR.
 */
class AesCtr {
public:
    /// @return Err(InvalidLength) if the key is neither 16 nor 32 bytes
    static Result<std::vector<uint8_t>, CryptoFailure> Encrypt(
        const models::EncryptionKey& key,
        const CtrNonce& nonce,
        std::span<const uint8_t> plaintext);

    static Result<std::vector<uint8_t>, CryptoFailure> Decrypt(
        const models::EncryptionKey& key,
        const CtrNonce& nonce,
        std::span<const uint8_t> ciphertext);

    /// Transform a header slice where it lies.
    static Result<Unit, CryptoFailure> ApplyInPlace(
        const models::EncryptionKey& key,
        const CtrNonce& nonce,
        std::span<uint8_t> data);

private:
    AesCtr() = delete;
};
}
