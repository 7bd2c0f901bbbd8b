#pragma once
#include "mixcore/crypto/sodium_secure_memory_handle.hpp"
#include "mixcore/core/constants.hpp"
#include "mixcore/core/failures.hpp"
#include "mixcore/core/result.hpp"
#include <fmt/core.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
namespace mixcore::models {

// Each role is a distinct key type, so a key derived for one purpose cannot be
// passed to an operation expecting another.

struct PrivateScalarRole {
    static constexpr std::string_view NAME = "X25519 private scalar";
    static constexpr CryptoFailureType LENGTH_FAILURE = CryptoFailureType::InvalidEncoding;
    static constexpr bool IsValidSize(const size_t size) noexcept {
        return size == Constants::X_25519_PRIVATE_KEY_SIZE;
    }
};

struct SharedSecretRole {
    static constexpr std::string_view NAME = "X25519 shared secret";
    static constexpr CryptoFailureType LENGTH_FAILURE = CryptoFailureType::InvalidEncoding;
    static constexpr bool IsValidSize(const size_t size) noexcept {
        return size == Constants::X_25519_SHARED_SECRET_SIZE;
    }
};

struct EncryptionKeyRole {
    static constexpr std::string_view NAME = "AES-CTR encryption key";
    static constexpr CryptoFailureType LENGTH_FAILURE = CryptoFailureType::InvalidLength;
    static constexpr bool IsValidSize(const size_t size) noexcept {
        return size == Constants::AES_128_KEY_SIZE || size == Constants::AES_256_KEY_SIZE;
    }
};

struct MacKeyRole {
    static constexpr std::string_view NAME = "BLAKE3 MAC key";
    static constexpr CryptoFailureType LENGTH_FAILURE = CryptoFailureType::InvalidLength;
    static constexpr bool IsValidSize(const size_t size) noexcept {
        return size == Constants::MAC_KEY_SIZE;
    }
};

struct BlindingFactorRole {
    static constexpr std::string_view NAME = "blinding factor";
    static constexpr CryptoFailureType LENGTH_FAILURE = CryptoFailureType::InvalidLength;
    static constexpr bool IsValidSize(const size_t size) noexcept {
        return size == Constants::BLINDING_FACTOR_SIZE;
    }
};

struct ReplayKeyRole {
    static constexpr std::string_view NAME = "replay identifier key";
    static constexpr CryptoFailureType LENGTH_FAILURE = CryptoFailureType::InvalidLength;
    static constexpr bool IsValidSize(const size_t size) noexcept {
        return size == Constants::REPLAY_KEY_SIZE;
    }
};

struct SigningSecretRole {
    static constexpr std::string_view NAME = "Ed25519 signing key";
    static constexpr CryptoFailureType LENGTH_FAILURE = CryptoFailureType::InvalidEncoding;
    static constexpr bool IsValidSize(const size_t size) noexcept {
        return size == Constants::ED_25519_SECRET_KEY_SIZE;
    }
};

/**
 * @brief Move-only secret key bound to a single role
 *
 * Owns its bytes through a SecureMemoryHandle; they are wiped when the key
 * is destroyed. Failure messages name the role and length only.
 */
template<typename Role>
class SecretKey {
public:
    [[nodiscard]] static Result<SecretKey, CryptoFailure> FromHandle(
        crypto::SecureMemoryHandle handle) {
        if (handle.IsInvalid()) {
            return Result<SecretKey, CryptoFailure>::Err(
                CryptoFailure::InvalidState(
                    fmt::format("{} handle has been disposed", Role::NAME)));
        }
        if (!Role::IsValidSize(handle.Size())) {
            return Result<SecretKey, CryptoFailure>::Err(
                CryptoFailure(Role::LENGTH_FAILURE,
                    fmt::format("{} has invalid length {}", Role::NAME, handle.Size())));
        }
        return Result<SecretKey, CryptoFailure>::Ok(SecretKey(std::move(handle)));
    }

    [[nodiscard]] static Result<SecretKey, CryptoFailure> FromBytes(
        std::span<const uint8_t> bytes) {
        if (!Role::IsValidSize(bytes.size())) {
            return Result<SecretKey, CryptoFailure>::Err(
                CryptoFailure(Role::LENGTH_FAILURE,
                    fmt::format("{} has invalid length {}", Role::NAME, bytes.size())));
        }
        auto handle_result = crypto::SecureMemoryHandle::Allocate(bytes.size());
        if (handle_result.IsErr()) {
            return Result<SecretKey, CryptoFailure>::Err(
                CryptoFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        auto handle = std::move(handle_result).Unwrap();
        auto write_result = handle.Write(bytes);
        if (write_result.IsErr()) {
            return Result<SecretKey, CryptoFailure>::Err(
                CryptoFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        return FromHandle(std::move(handle));
    }

    SecretKey(SecretKey&&) noexcept = default;
    SecretKey& operator=(SecretKey&&) noexcept = default;
    SecretKey(const SecretKey&) = delete;
    SecretKey& operator=(const SecretKey&) = delete;
    ~SecretKey() = default;

    [[nodiscard]] const crypto::SecureMemoryHandle& GetHandle() const noexcept {
        return handle_;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return handle_.Size();
    }

private:
    explicit SecretKey(crypto::SecureMemoryHandle handle) noexcept
        : handle_(std::move(handle)) {
    }

    crypto::SecureMemoryHandle handle_;
};

using PrivateScalar = SecretKey<PrivateScalarRole>;
using SharedSecret = SecretKey<SharedSecretRole>;
using EncryptionKey = SecretKey<EncryptionKeyRole>;
using MacKey = SecretKey<MacKeyRole>;
using BlindingFactor = SecretKey<BlindingFactorRole>;
using ReplayKey = SecretKey<ReplayKeyRole>;
using SigningSecret = SecretKey<SigningSecretRole>;

}
