#pragma once
#include "mixcore/models/key_materials/secret_key.hpp"
#include "mixcore/models/key_materials/public_point.hpp"
namespace mixcore::models {
class X25519KeyPair {
public:
    X25519KeyPair(PrivateScalar private_scalar, const PublicPoint& public_point) noexcept
        : private_scalar_(std::move(private_scalar))
        , public_point_(public_point) {
    }
    X25519KeyPair(X25519KeyPair&&) noexcept = default;
    X25519KeyPair& operator=(X25519KeyPair&&) noexcept = default;
    X25519KeyPair(const X25519KeyPair&) = delete;
    X25519KeyPair& operator=(const X25519KeyPair&) = delete;
    [[nodiscard]] const PrivateScalar& GetPrivateScalar() const noexcept {
        return private_scalar_;
    }
    [[nodiscard]] const PublicPoint& GetPublicPoint() const noexcept {
        return public_point_;
    }
    [[nodiscard]] PrivateScalar TakePrivateScalar() && {
        return std::move(private_scalar_);
    }
private:
    PrivateScalar private_scalar_;
    PublicPoint public_point_;
};
}
