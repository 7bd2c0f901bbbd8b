#include "mixcore/models/key_materials/public_point.hpp"
#include "mixcore/utilities/base58.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace mixcore::models {

Result<PublicPoint, CryptoFailure> PublicPoint::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<PublicPoint, CryptoFailure>::Err(
            CryptoFailure::InvalidEncoding(
                fmt::format("X25519 public point must be {} bytes, got {}",
                    Constants::X_25519_PUBLIC_KEY_SIZE, bytes.size())));
    }
    Bytes point{};
    std::copy(bytes.begin(), bytes.end(), point.begin());
    return Result<PublicPoint, CryptoFailure>::Ok(PublicPoint(point));
}

Result<PublicPoint, CryptoFailure> PublicPoint::FromBase58(std::string_view text) {
    auto decoded = utilities::Base58::Decode(text);
    if (decoded.IsErr()) {
        return Result<PublicPoint, CryptoFailure>::Err(std::move(decoded).UnwrapErr());
    }
    return FromBytes(decoded.Unwrap());
}

std::string PublicPoint::ToBase58() const {
    return utilities::Base58::Encode(bytes_);
}

}
