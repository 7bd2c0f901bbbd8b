#pragma once
#include <string>
#include <string_view>
namespace mixcore {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    AllocationFailed,
    InvalidOperation
};
enum class CryptoFailureType {
    InvalidEncoding,
    KeyExchange,
    InvalidLength,
    VerificationFailed,
    RandomSourceFailure,
    InvalidState,
    Backend
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
/**
 * @brief Failure returned by every public mixcore operation.
 *
 * Messages describe the operation and the offending sizes only. They never
 * carry key, secret or plaintext bytes.
 */
class CryptoFailure {
public:
    CryptoFailureType type;
    std::string message;
    CryptoFailure(const CryptoFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CryptoFailure InvalidEncoding(std::string msg) {
        return {CryptoFailureType::InvalidEncoding, std::move(msg)};
    }
    static CryptoFailure KeyExchange(std::string msg) {
        return {CryptoFailureType::KeyExchange, std::move(msg)};
    }
    static CryptoFailure InvalidLength(std::string msg) {
        return {CryptoFailureType::InvalidLength, std::move(msg)};
    }
    /// Tag and signature mismatches share this one failure and one message.
    static CryptoFailure VerificationFailed() {
        return {CryptoFailureType::VerificationFailed, "Verification failed"};
    }
    static CryptoFailure RandomSourceFailure(std::string msg) {
        return {CryptoFailureType::RandomSourceFailure, std::move(msg)};
    }
    static CryptoFailure InvalidState(std::string msg) {
        return {CryptoFailureType::InvalidState, std::move(msg)};
    }
    static CryptoFailure Backend(std::string msg) {
        return {CryptoFailureType::Backend, std::move(msg)};
    }
    static CryptoFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InvalidOperation) {
            return InvalidState(sf.message);
        }
        return Backend(sf.message);
    }
};
[[nodiscard]] constexpr std::string_view ToString(const CryptoFailureType type) noexcept {
    switch (type) {
        case CryptoFailureType::InvalidEncoding: return "InvalidEncoding";
        case CryptoFailureType::KeyExchange: return "KeyExchange";
        case CryptoFailureType::InvalidLength: return "InvalidLength";
        case CryptoFailureType::VerificationFailed: return "VerificationFailed";
        case CryptoFailureType::RandomSourceFailure: return "RandomSourceFailure";
        case CryptoFailureType::InvalidState: return "InvalidState";
        case CryptoFailureType::Backend: return "Backend";
    }
    return "Unknown";
}
}
