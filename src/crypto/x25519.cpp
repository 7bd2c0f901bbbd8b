#include "mixcore/crypto/x25519.hpp"
#include "mixcore/crypto/sodium_interop.hpp"
#include "mixcore/crypto/sodium_secure_memory_handle.hpp"
#include "mixcore/security/validation/dh_validator.hpp"
#include "mixcore/debug/trace_logger.hpp"
#include "mixcore/core/constants.hpp"

#include <sodium.h>

namespace mixcore::crypto {

using models::BlindingFactor;
using models::PrivateScalar;
using models::PublicPoint;
using models::SharedSecret;
using models::X25519KeyPair;

namespace {
    /// out = scalar * point, rejecting degenerate inputs and outputs.
    Result<SecureMemoryHandle, CryptoFailure> ScalarMult(
        const SecureMemoryHandle& scalar,
        const PublicPoint& point) {

        auto validation = security::DhValidator::ValidateX25519PublicKey(point.AsSpan());
        if (validation.IsErr()) {
            return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(validation).UnwrapErr());
        }

        auto output_result = SecureMemoryHandle::Allocate(Constants::X_25519_SHARED_SECRET_SIZE);
        if (output_result.IsErr()) {
            return Result<SecureMemoryHandle, CryptoFailure>::Err(
                CryptoFailure::FromSodiumFailure(output_result.UnwrapErr()));
        }
        auto output = std::move(output_result).Unwrap();

        auto mult_result = FlattenAccess(scalar.WithReadAccess([&](std::span<const uint8_t> scalar_bytes) {
            return FlattenAccess(output.WithWriteAccess([&](std::span<uint8_t> output_bytes) {
                if (crypto_scalarmult(output_bytes.data(), scalar_bytes.data(), point.AsSpan().data())
                    != SodiumConstants::SUCCESS) {
                    return Result<Unit, CryptoFailure>::Err(
                        CryptoFailure::KeyExchange(std::string(ErrorMessages::DEGENERATE_SHARED_SECRET)));
                }
                if (SodiumInterop::IsAllZero(output_bytes)) {
                    return Result<Unit, CryptoFailure>::Err(
                        CryptoFailure::KeyExchange(std::string(ErrorMessages::DEGENERATE_SHARED_SECRET)));
                }
                return Result<Unit, CryptoFailure>::Ok(unit);
            }));
        }));
        if (mult_result.IsErr()) {
            return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(mult_result).UnwrapErr());
        }

        return Result<SecureMemoryHandle, CryptoFailure>::Ok(std::move(output));
    }
}

Result<X25519KeyPair, CryptoFailure> X25519::GenerateKeyPair(interfaces::ISecureRandom& random) {
    auto scalar_result = SecureMemoryHandle::Allocate(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (scalar_result.IsErr()) {
        return Result<X25519KeyPair, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(scalar_result.UnwrapErr()));
    }
    auto scalar_handle = std::move(scalar_result).Unwrap();

    auto fill_result = FlattenAccess(scalar_handle.WithWriteAccess([&](std::span<uint8_t> scalar_bytes) {
        return random.Fill(scalar_bytes);
    }));
    if (fill_result.IsErr()) {
        return Result<X25519KeyPair, CryptoFailure>::Err(std::move(fill_result).UnwrapErr());
    }

    auto private_scalar = PrivateScalar::FromHandle(std::move(scalar_handle));
    if (private_scalar.IsErr()) {
        return Result<X25519KeyPair, CryptoFailure>::Err(std::move(private_scalar).UnwrapErr());
    }

    auto public_point = DerivePublicPoint(private_scalar.Unwrap());
    if (public_point.IsErr()) {
        return Result<X25519KeyPair, CryptoFailure>::Err(std::move(public_point).UnwrapErr());
    }

    MIXCORE_TRACE_PUBLIC("X25519", "generated_public", public_point.Unwrap().AsSpan());

    return Result<X25519KeyPair, CryptoFailure>::Ok(
        X25519KeyPair(std::move(private_scalar).Unwrap(), public_point.Unwrap()));
}

Result<PublicPoint, CryptoFailure> X25519::DerivePublicPoint(const PrivateScalar& private_scalar) {
    PublicPoint::Bytes public_bytes{};
    auto derive_result = FlattenAccess(private_scalar.GetHandle().WithReadAccess(
        [&](std::span<const uint8_t> scalar_bytes) {
            if (crypto_scalarmult_base(public_bytes.data(), scalar_bytes.data())
                != SodiumConstants::SUCCESS) {
                return Result<Unit, CryptoFailure>::Err(
                    CryptoFailure::KeyExchange("Failed to derive X25519 public point"));
            }
            return Result<Unit, CryptoFailure>::Ok(unit);
        }));
    if (derive_result.IsErr()) {
        return Result<PublicPoint, CryptoFailure>::Err(std::move(derive_result).UnwrapErr());
    }
    return Result<PublicPoint, CryptoFailure>::Ok(PublicPoint(public_bytes));
}

Result<SharedSecret, CryptoFailure> X25519::DiffieHellman(
    const PrivateScalar& private_scalar,
    const PublicPoint& peer_public) {

    debug::LogKeyAgreement(peer_public.AsSpan());

    auto shared = ScalarMult(private_scalar.GetHandle(), peer_public);
    if (shared.IsErr()) {
        return Result<SharedSecret, CryptoFailure>::Err(std::move(shared).UnwrapErr());
    }
    return SharedSecret::FromHandle(std::move(shared).Unwrap());
}

Result<PublicPoint, CryptoFailure> X25519::BlindPublicPoint(
    const PublicPoint& point,
    const BlindingFactor& blinding_factor) {

    auto blinded = ScalarMult(blinding_factor.GetHandle(), point);
    if (blinded.IsErr()) {
        return Result<PublicPoint, CryptoFailure>::Err(std::move(blinded).UnwrapErr());
    }

    PublicPoint::Bytes blinded_bytes{};
    const auto blinded_handle = std::move(blinded).Unwrap();
    auto read_result = blinded_handle.Read(blinded_bytes);
    if (read_result.IsErr()) {
        return Result<PublicPoint, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }

    MIXCORE_TRACE_PUBLIC("X25519", "blinded_public", blinded_bytes);
    return Result<PublicPoint, CryptoFailure>::Ok(PublicPoint(blinded_bytes));
}

} // namespace mixcore::crypto
