#pragma once
#include "mixcore/core/result.hpp"
#include "mixcore/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace mixcore::utilities {
/**
 * @brief Base58 text encoding with the Bitcoin alphabet
 *
 * Identity and sphinx public keys are exchanged between nodes in this form.
 * Leading zero bytes map to leading '1' characters.
 */
class Base58 {
public:
    static constexpr std::string_view ALPHABET =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    [[nodiscard]] static std::string Encode(std::span<const uint8_t> data);

    /// Fails with InvalidEncoding on a character outside the alphabet or an
    /// input longer than Constants::BASE58_MAX_INPUT_LENGTH.
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> Decode(std::string_view text);

private:
    Base58() = delete;
};
}
