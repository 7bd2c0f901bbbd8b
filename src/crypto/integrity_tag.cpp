#include "mixcore/crypto/integrity_tag.hpp"
#include "mixcore/crypto/sodium_interop.hpp"
#include "mixcore/core/constants.hpp"

#include <blake3.h>
#include <sodium.h>

#include <array>

namespace mixcore::crypto {

using models::MacKey;
using models::ReplayId;
using models::ReplayKey;
using models::Tag;

namespace {
    static_assert(BLAKE3_KEY_LEN == Constants::BLAKE3_KEY_SIZE, "BLAKE3 key width mismatch");

    /// Keyed BLAKE3 over `parts`; length-prefixed when `framed`.
    template<size_t OutSize>
    Result<std::array<uint8_t, OutSize>, CryptoFailure> KeyedHash(
        const SecureMemoryHandle& key,
        std::span<const std::span<const uint8_t>> parts,
        const bool framed) {
        using Output = std::array<uint8_t, OutSize>;

        if (key.Size() != BLAKE3_KEY_LEN) {
            return Result<Output, CryptoFailure>::Err(
                CryptoFailure::InvalidLength("BLAKE3 key must be 32 bytes"));
        }

        auto access = key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
            blake3_hasher hasher;
            blake3_hasher_init_keyed(&hasher, key_bytes.data());
            for (const auto part : parts) {
                if (framed) {
                    std::array<uint8_t, Constants::MULTIPART_LENGTH_PREFIX_SIZE> prefix{};
                    const uint64_t length = part.size();
                    for (size_t i = 0; i < prefix.size(); ++i) {
                        prefix[i] = static_cast<uint8_t>((length >> (i * 8)) & 0xFF);
                    }
                    blake3_hasher_update(&hasher, prefix.data(), prefix.size());
                }
                if (!part.empty()) {
                    blake3_hasher_update(&hasher, part.data(), part.size());
                }
            }
            Output output{};
            blake3_hasher_finalize(&hasher, output.data(), output.size());
            sodium_memzero(&hasher, sizeof(hasher));
            return output;
        });
        if (access.IsErr()) {
            return Result<Output, CryptoFailure>::Err(
                CryptoFailure::FromSodiumFailure(access.UnwrapErr()));
        }
        return Result<Output, CryptoFailure>::Ok(access.Unwrap());
    }

    Result<Tag, CryptoFailure> ComputeParts(
        const MacKey& key,
        std::span<const std::span<const uint8_t>> parts,
        const bool framed) {
        auto digest = KeyedHash<Constants::TAG_SIZE>(key.GetHandle(), parts, framed);
        if (digest.IsErr()) {
            return Result<Tag, CryptoFailure>::Err(std::move(digest).UnwrapErr());
        }
        return Result<Tag, CryptoFailure>::Ok(Tag(digest.Unwrap()));
    }

    Result<Unit, CryptoFailure> Check(
        const Result<Tag, CryptoFailure>& computed,
        const Tag& expected) {
        if (computed.IsErr()) {
            return Result<Unit, CryptoFailure>::Err(computed.UnwrapErr());
        }
        if (!SodiumInterop::ConstantTimeEquals(computed.Unwrap().AsSpan(), expected.AsSpan())) {
            return Result<Unit, CryptoFailure>::Err(CryptoFailure::VerificationFailed());
        }
        return Result<Unit, CryptoFailure>::Ok(unit);
    }
}

Result<Tag, CryptoFailure> IntegrityTag::Compute(
    const MacKey& key,
    std::span<const uint8_t> message) {
    const std::array<std::span<const uint8_t>, 1> parts{message};
    return ComputeParts(key, parts, false);
}

Result<Tag, CryptoFailure> IntegrityTag::Compute(
    const MacKey& key,
    std::initializer_list<std::span<const uint8_t>> parts) {
    return ComputeParts(key, std::span<const std::span<const uint8_t>>(parts.begin(), parts.size()), true);
}

bool IntegrityTag::Verify(
    const MacKey& key,
    std::span<const uint8_t> message,
    const Tag& expected) {
    return VerifyOrFail(key, message, expected).IsOk();
}

Result<Unit, CryptoFailure> IntegrityTag::VerifyOrFail(
    const MacKey& key,
    std::span<const uint8_t> message,
    const Tag& expected) {
    return Check(Compute(key, message), expected);
}

Result<Unit, CryptoFailure> IntegrityTag::VerifyOrFail(
    const MacKey& key,
    std::initializer_list<std::span<const uint8_t>> parts,
    const Tag& expected) {
    return Check(Compute(key, parts), expected);
}

Result<ReplayId, CryptoFailure> ReplayTag::Derive(
    const ReplayKey& key,
    std::span<const uint8_t> message) {
    const std::array<std::span<const uint8_t>, 1> parts{message};
    auto digest = KeyedHash<Constants::REPLAY_ID_SIZE>(key.GetHandle(), parts, false);
    if (digest.IsErr()) {
        return Result<ReplayId, CryptoFailure>::Err(std::move(digest).UnwrapErr());
    }
    return Result<ReplayId, CryptoFailure>::Ok(ReplayId(digest.Unwrap()));
}

}
