#include "mixcore/security/validation/dh_validator.hpp"
#include "mixcore/crypto/sodium_interop.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace mixcore::security {

using crypto::SodiumInterop;

Result<Unit, CryptoFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {

    // Step 1: Validate size
    if (public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::KeyExchange(
                fmt::format("Invalid X25519 public key size: expected {}, got {}",
                    Constants::X_25519_PUBLIC_KEY_SIZE, public_key.size())));
    }

    // Step 2: Check for small-order points
    if (HasSmallOrder(public_key)) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::KeyExchange("X25519 public key is a small-order point"));
    }

    // Step 3: Validate field element
    if (!IsCanonicalFieldElement(public_key)) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::KeyExchange("X25519 public key is not a canonical field element"));
    }

    return Result<Unit, CryptoFailure>::Ok(unit);
}

DhValidator::FieldBytes DhValidator::Masked(std::span<const uint8_t> public_key) noexcept {
    FieldBytes masked{};
    std::copy_n(public_key.begin(), std::min(public_key.size(), masked.size()), masked.begin());
    masked.back() &= Constants::CURVE_25519_TOP_BIT_MASK;
    return masked;
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) noexcept {
    if (public_key.size() != Constants::CURVE_25519_FIELD_ELEMENT_SIZE) {
        return false;
    }
    const FieldBytes masked = Masked(public_key);

    // No early exit, every entry is compared
    bool found = false;
    for (const auto& small_order_point : SMALL_ORDER_POINTS) {
        found |= SodiumInterop::ConstantTimeEquals(masked, small_order_point);
    }
    return found;
}

bool DhValidator::IsCanonicalFieldElement(std::span<const uint8_t> public_key) noexcept {
    if (public_key.size() != Constants::CURVE_25519_FIELD_ELEMENT_SIZE) {
        return false;
    }
    const FieldBytes masked = Masked(public_key);

    // Compare from the most significant byte down
    for (size_t i = masked.size(); i-- > 0;) {
        if (masked[i] < CURVE_25519_PRIME[i]) {
            return true;
        }
        if (masked[i] > CURVE_25519_PRIME[i]) {
            return false;
        }
    }

    // Equal to p
    return false;
}

} // namespace mixcore::security
