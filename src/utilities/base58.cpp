#include "mixcore/utilities/base58.hpp"
#include "mixcore/core/constants.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <array>

namespace mixcore::utilities {

namespace {
    constexpr int8_t INVALID_DIGIT = -1;

    constexpr std::array<int8_t, 128> BuildDigitTable() {
        std::array<int8_t, 128> table{};
        for (auto& entry : table) {
            entry = INVALID_DIGIT;
        }
        for (size_t i = 0; i < Base58::ALPHABET.size(); ++i) {
            table[static_cast<uint8_t>(Base58::ALPHABET[i])] = static_cast<int8_t>(i);
        }
        return table;
    }

    constexpr auto DIGITS = BuildDigitTable();
}

std::string Base58::Encode(std::span<const uint8_t> data) {
    size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // log(256) / log(58) ~= 1.37
    std::vector<uint8_t> digits((data.size() - leading_zeros) * 138 / 100 + 1, 0);
    size_t digits_len = 0;
    for (size_t i = leading_zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < digits_len) && it != digits.rend(); ++it, ++j) {
            carry += 256u * *it;
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        digits_len = j;
    }

    auto first = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - digits_len);
    while (first != digits.end() && *first == 0) {
        ++first;
    }
    std::string encoded(leading_zeros, ALPHABET[0]);
    encoded.reserve(leading_zeros + static_cast<size_t>(digits.end() - first));
    for (auto it = first; it != digits.end(); ++it) {
        encoded.push_back(ALPHABET[*it]);
    }
    return encoded;
}

Result<std::vector<uint8_t>, CryptoFailure> Base58::Decode(std::string_view text) {
    if (text.size() > Constants::BASE58_MAX_INPUT_LENGTH) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidEncoding(
                fmt::format("Base58 input too long ({} characters, max {})",
                    text.size(), Constants::BASE58_MAX_INPUT_LENGTH)));
    }

    size_t leading_ones = 0;
    while (leading_ones < text.size() && text[leading_ones] == ALPHABET[0]) {
        ++leading_ones;
    }

    // log(58) / log(256) ~= 0.733
    std::vector<uint8_t> bytes((text.size() - leading_ones) * 733 / 1000 + 1, 0);
    size_t bytes_len = 0;
    for (size_t i = leading_ones; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        const int8_t digit = c < DIGITS.size() ? DIGITS[c] : INVALID_DIGIT;
        if (digit == INVALID_DIGIT) {
            return Result<std::vector<uint8_t>, CryptoFailure>::Err(
                CryptoFailure::InvalidEncoding(
                    fmt::format("Invalid Base58 character at position {}", i)));
        }
        uint32_t carry = static_cast<uint32_t>(digit);
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < bytes_len) && it != bytes.rend(); ++it, ++j) {
            carry += 58u * *it;
            *it = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        bytes_len = j;
    }

    auto first = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - bytes_len);
    while (first != bytes.end() && *first == 0) {
        ++first;
    }
    std::vector<uint8_t> decoded(leading_ones, 0);
    decoded.insert(decoded.end(), first, bytes.end());
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(decoded));
}

}
