#pragma once
#include "mixcore/models/key_materials/secret_key.hpp"
#include "mixcore/models/key_materials/verifying_key.hpp"
namespace mixcore::models {
/// Ed25519 identity. The secret half uses libsodium's 64-byte seed || public layout.
class SigningKeyPair {
public:
    SigningKeyPair(SigningSecret signing_secret, const VerifyingKey& verifying_key) noexcept
        : signing_secret_(std::move(signing_secret))
        , verifying_key_(verifying_key) {
    }
    SigningKeyPair(SigningKeyPair&&) noexcept = default;
    SigningKeyPair& operator=(SigningKeyPair&&) noexcept = default;
    SigningKeyPair(const SigningKeyPair&) = delete;
    SigningKeyPair& operator=(const SigningKeyPair&) = delete;
    [[nodiscard]] const SigningSecret& GetSigningSecret() const noexcept {
        return signing_secret_;
    }
    [[nodiscard]] const VerifyingKey& GetVerifyingKey() const noexcept {
        return verifying_key_;
    }
private:
    SigningSecret signing_secret_;
    VerifyingKey verifying_key_;
};
}
