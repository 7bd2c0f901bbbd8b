#pragma once
#include "mixcore/interfaces/i_secure_random.hpp"
namespace mixcore::crypto {
/// Production random source backed by libsodium's randombytes_buf.
class SodiumSecureRandom final : public interfaces::ISecureRandom {
public:
    [[nodiscard]] Result<Unit, CryptoFailure> Fill(std::span<uint8_t> output) override;
};
}
