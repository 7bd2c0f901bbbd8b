#include "mixcore/crypto/ed25519.hpp"
#include "mixcore/crypto/sodium_secure_memory_handle.hpp"
#include "mixcore/debug/trace_logger.hpp"
#include "mixcore/core/constants.hpp"

#include <fmt/core.h>
#include <sodium.h>

#include <array>

namespace mixcore::crypto {

using models::Signature;
using models::SigningKeyPair;
using models::SigningSecret;
using models::VerifyingKey;

static_assert(crypto_sign_PUBLICKEYBYTES == Constants::ED_25519_PUBLIC_KEY_SIZE);
static_assert(crypto_sign_SECRETKEYBYTES == Constants::ED_25519_SECRET_KEY_SIZE);
static_assert(crypto_sign_SEEDBYTES == Constants::ED_25519_SEED_SIZE);
static_assert(crypto_sign_BYTES == Constants::ED_25519_SIGNATURE_SIZE);

Result<SigningKeyPair, CryptoFailure> Ed25519::GenerateKeyPair(interfaces::ISecureRandom& random) {
    auto seed_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SEED_SIZE);
    if (seed_result.IsErr()) {
        return Result<SigningKeyPair, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(seed_result.UnwrapErr()));
    }
    auto seed = std::move(seed_result).Unwrap();

    auto fill_result = FlattenAccess(seed.WithWriteAccess([&](std::span<uint8_t> seed_bytes) {
        return random.Fill(seed_bytes);
    }));
    if (fill_result.IsErr()) {
        return Result<SigningKeyPair, CryptoFailure>::Err(std::move(fill_result).UnwrapErr());
    }

    return FlattenAccess(seed.WithReadAccess([](std::span<const uint8_t> seed_bytes) {
        return FromSeed(seed_bytes);
    }));
}

Result<SigningKeyPair, CryptoFailure> Ed25519::FromSeed(std::span<const uint8_t> seed) {
    if (seed.size() != Constants::ED_25519_SEED_SIZE) {
        return Result<SigningKeyPair, CryptoFailure>::Err(
            CryptoFailure::InvalidLength(
                fmt::format("Ed25519 seed must be {} bytes, got {}",
                    Constants::ED_25519_SEED_SIZE, seed.size())));
    }

    auto secret_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (secret_result.IsErr()) {
        return Result<SigningKeyPair, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(secret_result.UnwrapErr()));
    }
    auto secret = std::move(secret_result).Unwrap();

    std::array<uint8_t, Constants::ED_25519_PUBLIC_KEY_SIZE> public_bytes{};
    auto keypair_result = FlattenAccess(secret.WithWriteAccess([&](std::span<uint8_t> secret_bytes) {
        if (crypto_sign_seed_keypair(public_bytes.data(), secret_bytes.data(), seed.data())
            != SodiumConstants::SUCCESS) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::Backend("Failed to generate Ed25519 keypair from seed"));
        }
        return Result<Unit, CryptoFailure>::Ok(unit);
    }));
    if (keypair_result.IsErr()) {
        return Result<SigningKeyPair, CryptoFailure>::Err(std::move(keypair_result).UnwrapErr());
    }

    auto verifying_key = VerifyingKey::FromBytes(public_bytes);
    if (verifying_key.IsErr()) {
        return Result<SigningKeyPair, CryptoFailure>::Err(std::move(verifying_key).UnwrapErr());
    }
    auto signing_secret = SigningSecret::FromHandle(std::move(secret));
    if (signing_secret.IsErr()) {
        return Result<SigningKeyPair, CryptoFailure>::Err(std::move(signing_secret).UnwrapErr());
    }

    MIXCORE_TRACE_PUBLIC("ED25519", "verifying_key", verifying_key.Unwrap().AsSpan());

    return Result<SigningKeyPair, CryptoFailure>::Ok(
        SigningKeyPair(std::move(signing_secret).Unwrap(), verifying_key.Unwrap()));
}

Result<Signature, CryptoFailure> Ed25519::Sign(
    const SigningKeyPair& key_pair,
    std::span<const uint8_t> message) {
    Signature::Bytes signature{};
    auto sign_result = FlattenAccess(key_pair.GetSigningSecret().GetHandle().WithReadAccess(
        [&](std::span<const uint8_t> secret_bytes) {
            unsigned long long signature_len = 0;
            if (crypto_sign_detached(signature.data(), &signature_len,
                    message.data(), message.size(), secret_bytes.data()) != SodiumConstants::SUCCESS
                || signature_len != signature.size()) {
                return Result<Unit, CryptoFailure>::Err(
                    CryptoFailure::Backend("Ed25519 signing failed"));
            }
            return Result<Unit, CryptoFailure>::Ok(unit);
        }));
    if (sign_result.IsErr()) {
        return Result<Signature, CryptoFailure>::Err(std::move(sign_result).UnwrapErr());
    }
    return Signature::FromBytes(signature);
}

Result<Unit, CryptoFailure> Ed25519::Verify(
    const VerifyingKey& verifying_key,
    std::span<const uint8_t> message,
    const Signature& signature) {
    const int result = crypto_sign_verify_detached(
        signature.GetBytes().data(),
        message.data(),
        message.size(),
        verifying_key.GetBytes().data());
    if (result != SodiumConstants::SUCCESS) {
        return Result<Unit, CryptoFailure>::Err(CryptoFailure::VerificationFailed());
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

} // namespace mixcore::crypto
