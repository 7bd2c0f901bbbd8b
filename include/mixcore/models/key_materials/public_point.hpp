#pragma once
#include "mixcore/core/constants.hpp"
#include "mixcore/core/failures.hpp"
#include "mixcore/core/result.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
namespace mixcore::models {
/**
 * @brief X25519 public value (Montgomery u-coordinate)
 *
 * Decoding only checks the width. Whether the point is usable for key
 * agreement is decided by X25519::DiffieHellman, which rejects degenerate
 * points with CryptoFailureType::KeyExchange.
 */
class PublicPoint {
public:
    using Bytes = std::array<uint8_t, Constants::X_25519_PUBLIC_KEY_SIZE>;

    explicit PublicPoint(const Bytes& bytes) noexcept
        : bytes_(bytes) {
    }

    [[nodiscard]] static Result<PublicPoint, CryptoFailure> FromBytes(std::span<const uint8_t> bytes);
    [[nodiscard]] static Result<PublicPoint, CryptoFailure> FromBase58(std::string_view text);

    [[nodiscard]] const Bytes& GetBytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::string ToBase58() const;

    bool operator==(const PublicPoint&) const = default;

private:
    Bytes bytes_;
};
}
