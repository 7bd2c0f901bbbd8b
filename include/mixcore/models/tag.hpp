#pragma once
#include "mixcore/core/constants.hpp"
#include "mixcore/core/failures.hpp"
#include "mixcore/core/result.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
namespace mixcore::models {
/**
 * @brief Integrity tag over a header or payload
 *
 * Deliberately has no operator==. Tags are compared through
 * IntegrityTag::Verify, which runs in constant time.
 */
class Tag {
public:
    using Bytes = std::array<uint8_t, Constants::TAG_SIZE>;

    explicit Tag(const Bytes& bytes) noexcept
        : bytes_(bytes) {
    }

    [[nodiscard]] static Result<Tag, CryptoFailure> FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] const Bytes& GetBytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept {
        return bytes_;
    }

private:
    Bytes bytes_;
};

/// Identifier stored in a node's seen-packet set.
class ReplayId {
public:
    using Bytes = std::array<uint8_t, Constants::REPLAY_ID_SIZE>;

    explicit ReplayId(const Bytes& bytes) noexcept
        : bytes_(bytes) {
    }

    [[nodiscard]] static Result<ReplayId, CryptoFailure> FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] const Bytes& GetBytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept {
        return bytes_;
    }

    bool operator==(const ReplayId&) const = default;

    struct Hash {
        size_t operator()(const ReplayId& id) const noexcept {
            size_t value = 0;
            std::memcpy(&value, id.bytes_.data(), sizeof(value));
            return value;
        }
    };

private:
    Bytes bytes_;
};
}
