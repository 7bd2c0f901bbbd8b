#include "mixcore/crypto/sodium_secure_random.hpp"
#include "mixcore/crypto/sodium_interop.hpp"
#include "mixcore/core/constants.hpp"

#include <sodium.h>

namespace mixcore::crypto {

Result<Unit, CryptoFailure> SodiumSecureRandom::Fill(std::span<uint8_t> output) {
    // randombytes_buf is only guaranteed to use the system CSPRNG once
    // sodium_init has run
    if (!SodiumInterop::IsInitialized()) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::RandomSourceFailure(
                std::string(ErrorMessages::RANDOM_SOURCE_UNAVAILABLE)));
    }
    if (!output.empty()) {
        randombytes_buf(output.data(), output.size());
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

}
