#pragma once
#include "mixcore/core/constants.hpp"
#include "mixcore/core/failures.hpp"
#include "mixcore/core/result.hpp"
#include <array>
#include <cstdint>
#include <span>
namespace mixcore::models {
class Signature {
public:
    using Bytes = std::array<uint8_t, Constants::ED_25519_SIGNATURE_SIZE>;

    /// Rejects a wrong width and an S half whose top three bits are set.
    [[nodiscard]] static Result<Signature, CryptoFailure> FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] const Bytes& GetBytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept {
        return bytes_;
    }

    bool operator==(const Signature&) const = default;

private:
    explicit Signature(const Bytes& bytes) noexcept
        : bytes_(bytes) {
    }

    Bytes bytes_;
};
}
