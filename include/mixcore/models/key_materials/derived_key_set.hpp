#pragma once
#include "mixcore/crypto/sodium_secure_memory_handle.hpp"
#include "mixcore/core/failures.hpp"
#include "mixcore/core/result.hpp"
#include <cstddef>
#include <vector>
namespace mixcore::models {
/**
 * @brief Ordered sub-keys produced by one key derivation
 *
 * Each sub-key lives in its own secure allocation and can be taken out
 * exactly once. Sub-keys that are never taken are wiped with the set.
 */
class DerivedKeySet {
public:
    explicit DerivedKeySet(std::vector<crypto::SecureMemoryHandle> keys) noexcept
        : keys_(std::move(keys)) {
    }
    DerivedKeySet(DerivedKeySet&&) noexcept = default;
    DerivedKeySet& operator=(DerivedKeySet&&) noexcept = default;
    DerivedKeySet(const DerivedKeySet&) = delete;
    DerivedKeySet& operator=(const DerivedKeySet&) = delete;

    [[nodiscard]] size_t Count() const noexcept {
        return keys_.size();
    }

    /// Err(InvalidState) if the index is out of range or already taken.
    [[nodiscard]] Result<crypto::SecureMemoryHandle, CryptoFailure> Take(size_t index);

    /// Take a sub-key and bind it to a role, e.g. TakeAs<MacKey>(1).
    template<typename Key>
    [[nodiscard]] Result<Key, CryptoFailure> TakeAs(const size_t index) {
        auto handle = Take(index);
        if (handle.IsErr()) {
            return Result<Key, CryptoFailure>::Err(std::move(handle).UnwrapErr());
        }
        return Key::FromHandle(std::move(handle).Unwrap());
    }

private:
    std::vector<crypto::SecureMemoryHandle> keys_;
};
}
