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
 * @brief Ed25519 public key
 *
 * Can only be obtained through FromBytes / FromBase58, which reject
 * encodings that are not a canonical point on the curve.
 */
class VerifyingKey {
public:
    using Bytes = std::array<uint8_t, Constants::ED_25519_PUBLIC_KEY_SIZE>;

    [[nodiscard]] static Result<VerifyingKey, CryptoFailure> FromBytes(std::span<const uint8_t> bytes);
    [[nodiscard]] static Result<VerifyingKey, CryptoFailure> FromBase58(std::string_view text);

    [[nodiscard]] const Bytes& GetBytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::string ToBase58() const;

    bool operator==(const VerifyingKey&) const = default;

private:
    explicit VerifyingKey(const Bytes& bytes) noexcept
        : bytes_(bytes) {
    }

    Bytes bytes_;
};
}
