#pragma once

#include "mixcore/crypto/sodium_secure_memory_handle.hpp"
#include "mixcore/core/constants.hpp"
#include "mixcore/core/result.hpp"
#include "mixcore/core/failures.hpp"

#include <span>
#include <cstdint>

namespace mixcore::crypto {

/**
 * @brief HKDF (RFC 5869) instantiated with HMAC-BLAKE3
 *
 * HMAC is built over the unkeyed BLAKE3 hash with a 64-byte block and a
 * 32-byte output, so HASH_LEN is 32 and a single Expand can produce at most
 * 255 * 32 bytes.
 *
 * HKDF has two phases:
 * 1. Extract: Creates a pseudo-random key (PRK) from input key material
 * 2. Expand: Expands PRK into the requested number of output bytes
 *
 * The PRK is secret and is returned in secure memory.
 */
class Hkdf {
public:
    /**
     * @brief Derive key material in one call
     *
     * @param ikm Input key material (usually an X25519 shared secret)
     * @param output Output buffer to fill with derived key material
     * @param salt Optional salt (empty means HASH_LEN zero bytes)
     * @param info Context / domain-separation label
     * @return Ok on success, Err(InvalidLength) if output is empty or too large
     */
    static Result<Unit, CryptoFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /**
     * @brief HKDF Extract phase
     *
     * @return Ok(prk) where prk is HASH_LEN bytes of secure memory, or Err
     */
    static Result<SecureMemoryHandle, CryptoFailure> Extract(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt = {});

    /**
     * @brief HKDF Expand phase
     *
     * @param prk Pseudorandom key from Extract (must be HASH_LEN bytes)
     * @param output Output buffer to fill
     * @param info Optional context info
     */
    static Result<Unit, CryptoFailure> Expand(
        std::span<const uint8_t> prk,
        std::span<uint8_t> output,
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = Constants::HKDF_HASH_LEN;
    static constexpr size_t MAX_OUTPUT_LEN = Constants::HKDF_MAX_OUTPUT_LEN;

private:
    Hkdf() = delete;
};

} // namespace mixcore::crypto
