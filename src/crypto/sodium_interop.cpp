#include "mixcore/crypto/sodium_interop.hpp"

#include <sodium.h>

namespace mixcore::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        // sodium_init returns 1 when already initialised elsewhere in the process
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (buffer.empty()) {
        return;
    }
    sodium_memzero(buffer.data(), buffer.size());
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS;
}

bool SodiumInterop::IsAllZero(std::span<const uint8_t> buffer) noexcept {
    return sodium_is_zero(buffer.data(), buffer.size()) == 1;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized() || size > MAX_BUFFER_SIZE) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace mixcore::crypto
