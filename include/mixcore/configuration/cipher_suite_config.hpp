#pragma once

#include "mixcore/core/constants.hpp"

#include <cstddef>
#include <cstdint>

namespace mixcore::configuration {

/// Stream cipher used for header and payload layers
enum class StreamCipher : uint8_t {
    /// AES-128 in counter mode, 16-byte keys
    Aes128Ctr = 0,

    /// AES-256 in counter mode, 32-byte keys
    Aes256Ctr = 1
};

/// Cipher suite selection for per-hop key derivation
///
/// Decides how wide the derived encryption key is. The MAC, blinding and
/// replay keys are always 32 bytes.
///
/// @example
/// ```cpp
/// auto hop_keys = KeyDerivation::DeriveHopKeys(
///     shared_secret, "hop-0", CipherSuiteConfig::Default());
/// ```
class CipherSuiteConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// AES-128-CTR, the packet format's stream cipher
    [[nodiscard]] static constexpr CipherSuiteConfig Default() noexcept {
        return CipherSuiteConfig(StreamCipher::Aes128Ctr);
    }

    /// AES-256-CTR for deployments that want a wider key
    [[nodiscard]] static constexpr CipherSuiteConfig Aes256() noexcept {
        return CipherSuiteConfig(StreamCipher::Aes256Ctr);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr StreamCipher GetCipher() const noexcept {
        return cipher_;
    }

    [[nodiscard]] constexpr size_t EncryptionKeySize() const noexcept {
        switch (cipher_) {
            case StreamCipher::Aes128Ctr:
                return Constants::AES_128_KEY_SIZE;
            case StreamCipher::Aes256Ctr:
                return Constants::AES_256_KEY_SIZE;
        }
        return Constants::AES_128_KEY_SIZE; // Unreachable
    }

    [[nodiscard]] constexpr bool operator==(const CipherSuiteConfig& other) const noexcept {
        return cipher_ == other.cipher_;
    }

    [[nodiscard]] constexpr bool operator!=(const CipherSuiteConfig& other) const noexcept {
        return cipher_ != other.cipher_;
    }

private:
    explicit constexpr CipherSuiteConfig(const StreamCipher cipher) noexcept
        : cipher_(cipher) {}

    StreamCipher cipher_;
};

} // namespace mixcore::configuration
