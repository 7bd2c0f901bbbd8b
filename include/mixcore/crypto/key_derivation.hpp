#pragma once

#include "mixcore/configuration/cipher_suite_config.hpp"
#include "mixcore/models/key_materials/derived_key_set.hpp"
#include "mixcore/models/key_materials/hop_keys.hpp"
#include "mixcore/models/key_materials/secret_key.hpp"
#include "mixcore/core/result.hpp"
#include "mixcore/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace mixcore::crypto {

/**
 * @brief Turns an X25519 shared secret into role-bound sub-keys
 *
 * Every derivation carries a non-empty context label which is used as the
 * HKDF info. Distinct labels give computationally independent outputs, so
 * one shared secret can safely feed several roles.
 */
class KeyDerivation {
public:
    /**
     * @brief Expand a shared secret into one or more sub-keys
     *
     * Runs Extract once and Expand once over the sum of output_lengths, then
     * splits the result in order. For a fixed secret, context and salt, the
     * first sub-key of a longer request equals the same-length single request.
     *
     * @return Err(InvalidLength) if output_lengths is empty, contains a zero,
     *         sums above Hkdf::MAX_OUTPUT_LEN, or context is empty
     */
    [[nodiscard]] static Result<models::DerivedKeySet, CryptoFailure> Derive(
        const models::SharedSecret& shared_secret,
        std::string_view context,
        std::span<const size_t> output_lengths,
        std::span<const uint8_t> salt = {});

    /**
     * @brief Derive the full key bundle for one hop
     *
     * Each role uses its own context "<hop_context>/<role>" with role one of
     * enc, mac, blind, replay, nonce.
     */
    [[nodiscard]] static Result<models::HopKeys, CryptoFailure> DeriveHopKeys(
        const models::SharedSecret& shared_secret,
        std::string_view hop_context,
        const configuration::CipherSuiteConfig& config = configuration::CipherSuiteConfig::Default());

private:
    KeyDerivation() = delete;
};

} // namespace mixcore::crypto
