#pragma once
#include "mixcore/core/result.hpp"
#include "mixcore/core/failures.hpp"
#include <cstdint>
#include <span>
namespace mixcore::interfaces {
/**
 * @brief Source of cryptographically secure random bytes
 *
 * Passed explicitly to every key-generation call. Implementations must be
 * safe to call from several threads at once. A failure is reported as
 * CryptoFailureType::RandomSourceFailure and is never papered over with a
 * weaker source.
 */
class ISecureRandom {
public:
    virtual ~ISecureRandom() = default;
    [[nodiscard]] virtual Result<Unit, CryptoFailure> Fill(std::span<uint8_t> output) = 0;
};
}
