#include "mixcore/models/key_materials/derived_key_set.hpp"
#include <fmt/core.h>

namespace mixcore::models {

Result<crypto::SecureMemoryHandle, CryptoFailure> DerivedKeySet::Take(const size_t index) {
    if (index >= keys_.size()) {
        return Result<crypto::SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::InvalidState(
                fmt::format("Derived key index {} out of range (count: {})", index, keys_.size())));
    }
    if (keys_[index].IsInvalid()) {
        return Result<crypto::SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::InvalidState(
                fmt::format("Derived key {} has already been taken", index)));
    }
    return Result<crypto::SecureMemoryHandle, CryptoFailure>::Ok(std::move(keys_[index]));
}

}
