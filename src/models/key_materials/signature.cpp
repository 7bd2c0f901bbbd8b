#include "mixcore/models/key_materials/signature.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace mixcore::models {

Result<Signature, CryptoFailure> Signature::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::ED_25519_SIGNATURE_SIZE) {
        return Result<Signature, CryptoFailure>::Err(
            CryptoFailure::InvalidEncoding(
                fmt::format("Ed25519 signature must be {} bytes, got {}",
                    Constants::ED_25519_SIGNATURE_SIZE, bytes.size())));
    }
    if ((bytes[Constants::ED_25519_SIGNATURE_SIZE - 1] & Constants::ED_25519_SIGNATURE_S_HIGH_BITS) != 0) {
        return Result<Signature, CryptoFailure>::Err(
            CryptoFailure::InvalidEncoding("Ed25519 signature scalar is not reduced"));
    }
    Bytes signature{};
    std::copy(bytes.begin(), bytes.end(), signature.begin());
    return Result<Signature, CryptoFailure>::Ok(Signature(signature));
}

}
