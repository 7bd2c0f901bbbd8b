#include "mixcore/crypto/key_derivation.hpp"
#include "mixcore/crypto/hkdf.hpp"
#include "mixcore/crypto/nonce_sequence.hpp"
#include "mixcore/debug/trace_logger.hpp"
#include "mixcore/core/constants.hpp"

#include <fmt/core.h>

#include <array>
#include <string>
#include <vector>

namespace mixcore::crypto {

using models::DerivedKeySet;
using models::HopKeys;
using models::SharedSecret;

namespace {
    std::string RoleContext(std::string_view hop_context, std::string_view role) {
        std::string context;
        context.reserve(hop_context.size() + 1 + role.size());
        context.append(hop_context);
        context.push_back(ContextLabels::SEPARATOR);
        context.append(role);
        return context;
    }

    std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    Result<SecureMemoryHandle, CryptoFailure> DeriveSingle(
        const SharedSecret& shared_secret,
        const std::string& context,
        const size_t length) {
        const std::array<size_t, 1> lengths{length};
        auto set_result = KeyDerivation::Derive(shared_secret, context, lengths);
        if (set_result.IsErr()) {
            return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(set_result).UnwrapErr());
        }
        auto key_set = std::move(set_result).Unwrap();
        return key_set.Take(0);
    }

    template<typename Key>
    Result<Key, CryptoFailure> DeriveRoleKey(
        const SharedSecret& shared_secret,
        std::string_view hop_context,
        std::string_view role,
        const size_t length) {
        auto handle = DeriveSingle(shared_secret, RoleContext(hop_context, role), length);
        if (handle.IsErr()) {
            return Result<Key, CryptoFailure>::Err(std::move(handle).UnwrapErr());
        }
        return Key::FromHandle(std::move(handle).Unwrap());
    }
}

Result<DerivedKeySet, CryptoFailure> KeyDerivation::Derive(
    const SharedSecret& shared_secret,
    std::string_view context,
    std::span<const size_t> output_lengths,
    std::span<const uint8_t> salt) {

    if (context.empty()) {
        return Result<DerivedKeySet, CryptoFailure>::Err(
            CryptoFailure::InvalidLength(std::string(ErrorMessages::EMPTY_CONTEXT)));
    }
    if (output_lengths.empty()) {
        return Result<DerivedKeySet, CryptoFailure>::Err(
            CryptoFailure::InvalidLength("At least one output length is required"));
    }

    size_t total_length = 0;
    for (const size_t length : output_lengths) {
        if (length == 0) {
            return Result<DerivedKeySet, CryptoFailure>::Err(
                CryptoFailure::InvalidLength("Derived key length must be non-zero"));
        }
        if (length > Hkdf::MAX_OUTPUT_LEN - total_length) {
            return Result<DerivedKeySet, CryptoFailure>::Err(
                CryptoFailure::InvalidLength(
                    fmt::format("Total derived length exceeds maximum of {} bytes",
                        Hkdf::MAX_OUTPUT_LEN)));
        }
        total_length += length;
    }

    debug::LogDerivation(context, output_lengths.size(), total_length);

    auto prk_result = FlattenAccess(shared_secret.GetHandle().WithReadAccess(
        [&](std::span<const uint8_t> ikm) {
            return Hkdf::Extract(ikm, salt);
        }));
    if (prk_result.IsErr()) {
        return Result<DerivedKeySet, CryptoFailure>::Err(std::move(prk_result).UnwrapErr());
    }
    const auto prk = std::move(prk_result).Unwrap();

    auto okm_result = SecureMemoryHandle::Allocate(total_length);
    if (okm_result.IsErr()) {
        return Result<DerivedKeySet, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(okm_result.UnwrapErr()));
    }
    auto okm = std::move(okm_result).Unwrap();

    auto expand_result = FlattenAccess(prk.WithReadAccess([&](std::span<const uint8_t> prk_bytes) {
        return FlattenAccess(okm.WithWriteAccess([&](std::span<uint8_t> okm_bytes) {
            return Hkdf::Expand(prk_bytes, okm_bytes, AsBytes(context));
        }));
    }));
    if (expand_result.IsErr()) {
        return Result<DerivedKeySet, CryptoFailure>::Err(std::move(expand_result).UnwrapErr());
    }

    std::vector<SecureMemoryHandle> keys;
    keys.reserve(output_lengths.size());
    size_t offset = 0;
    for (const size_t length : output_lengths) {
        auto key_result = SecureMemoryHandle::Allocate(length);
        if (key_result.IsErr()) {
            return Result<DerivedKeySet, CryptoFailure>::Err(
                CryptoFailure::FromSodiumFailure(key_result.UnwrapErr()));
        }
        auto key = std::move(key_result).Unwrap();

        auto copy_result = okm.WithReadAccess([&](std::span<const uint8_t> okm_bytes) {
            return key.Write(okm_bytes.subspan(offset, length));
        });
        if (copy_result.IsErr()) {
            return Result<DerivedKeySet, CryptoFailure>::Err(
                CryptoFailure::FromSodiumFailure(copy_result.UnwrapErr()));
        }
        auto write_result = std::move(copy_result).Unwrap();
        if (write_result.IsErr()) {
            return Result<DerivedKeySet, CryptoFailure>::Err(
                CryptoFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }

        keys.push_back(std::move(key));
        offset += length;
    }

    return Result<DerivedKeySet, CryptoFailure>::Ok(DerivedKeySet(std::move(keys)));
}

Result<HopKeys, CryptoFailure> KeyDerivation::DeriveHopKeys(
    const SharedSecret& shared_secret,
    std::string_view hop_context,
    const configuration::CipherSuiteConfig& config) {

    if (hop_context.empty()) {
        return Result<HopKeys, CryptoFailure>::Err(
            CryptoFailure::InvalidLength(std::string(ErrorMessages::EMPTY_CONTEXT)));
    }

    auto encryption_key = DeriveRoleKey<models::EncryptionKey>(
        shared_secret, hop_context, ContextLabels::ENCRYPTION, config.EncryptionKeySize());
    if (encryption_key.IsErr()) {
        return Result<HopKeys, CryptoFailure>::Err(std::move(encryption_key).UnwrapErr());
    }

    auto mac_key = DeriveRoleKey<models::MacKey>(
        shared_secret, hop_context, ContextLabels::MAC, Constants::MAC_KEY_SIZE);
    if (mac_key.IsErr()) {
        return Result<HopKeys, CryptoFailure>::Err(std::move(mac_key).UnwrapErr());
    }

    auto blinding_factor = DeriveRoleKey<models::BlindingFactor>(
        shared_secret, hop_context, ContextLabels::BLINDING, Constants::BLINDING_FACTOR_SIZE);
    if (blinding_factor.IsErr()) {
        return Result<HopKeys, CryptoFailure>::Err(std::move(blinding_factor).UnwrapErr());
    }

    auto replay_key = DeriveRoleKey<models::ReplayKey>(
        shared_secret, hop_context, ContextLabels::REPLAY, Constants::REPLAY_KEY_SIZE);
    if (replay_key.IsErr()) {
        return Result<HopKeys, CryptoFailure>::Err(std::move(replay_key).UnwrapErr());
    }

    auto nonce_base = DeriveSingle(
        shared_secret, RoleContext(hop_context, ContextLabels::NONCE), Constants::CTR_NONCE_BASE_SIZE);
    if (nonce_base.IsErr()) {
        return Result<HopKeys, CryptoFailure>::Err(std::move(nonce_base).UnwrapErr());
    }
    auto nonce_sequence = NonceSequence::FromKeyMaterial(nonce_base.Unwrap());
    if (nonce_sequence.IsErr()) {
        return Result<HopKeys, CryptoFailure>::Err(std::move(nonce_sequence).UnwrapErr());
    }

    return Result<HopKeys, CryptoFailure>::Ok(HopKeys(
        std::move(encryption_key).Unwrap(),
        std::move(mac_key).Unwrap(),
        std::move(blinding_factor).Unwrap(),
        std::move(replay_key).Unwrap(),
        std::move(nonce_sequence).Unwrap()));
}

} // namespace mixcore::crypto
