#include "mixcore/models/key_materials/verifying_key.hpp"
#include "mixcore/utilities/base58.hpp"
#include <fmt/core.h>
#include <sodium.h>
#include <algorithm>

namespace mixcore::models {

Result<VerifyingKey, CryptoFailure> VerifyingKey::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return Result<VerifyingKey, CryptoFailure>::Err(
            CryptoFailure::InvalidEncoding(
                fmt::format("Ed25519 verifying key must be {} bytes, got {}",
                    Constants::ED_25519_PUBLIC_KEY_SIZE, bytes.size())));
    }
    if (crypto_core_ed25519_is_valid_point(bytes.data()) != SodiumConstants::VALID_POINT) {
        return Result<VerifyingKey, CryptoFailure>::Err(
            CryptoFailure::InvalidEncoding("Ed25519 verifying key is not a valid curve point"));
    }
    Bytes key{};
    std::copy(bytes.begin(), bytes.end(), key.begin());
    return Result<VerifyingKey, CryptoFailure>::Ok(VerifyingKey(key));
}

Result<VerifyingKey, CryptoFailure> VerifyingKey::FromBase58(std::string_view text) {
    auto decoded = utilities::Base58::Decode(text);
    if (decoded.IsErr()) {
        return Result<VerifyingKey, CryptoFailure>::Err(std::move(decoded).UnwrapErr());
    }
    return FromBytes(decoded.Unwrap());
}

std::string VerifyingKey::ToBase58() const {
    return utilities::Base58::Encode(bytes_);
}

}
