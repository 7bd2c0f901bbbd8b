#include <catch2/catch_test_macros.hpp>
#include "mixcore/models/key_materials/secret_key.hpp"
#include "mixcore/crypto/sodium_interop.hpp"
#include "helpers/secret_bytes.hpp"
#include <string>
#include <vector>

using namespace mixcore;
using namespace mixcore::crypto;
using namespace mixcore::models;
using namespace mixcore::test_helpers;

TEST_CASE("SecretKey - Role widths", "[models][secret_key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Encryption keys accept 16 and 32 bytes") {
        REQUIRE(EncryptionKey::FromBytes(std::vector<uint8_t>(16, 1)).IsOk());
        REQUIRE(EncryptionKey::FromBytes(std::vector<uint8_t>(32, 1)).IsOk());
        auto result = EncryptionKey::FromBytes(std::vector<uint8_t>(20, 1));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidLength);
    }

    SECTION("MAC, blinding and replay keys are 32 bytes") {
        REQUIRE(MacKey::FromBytes(std::vector<uint8_t>(32, 1)).IsOk());
        REQUIRE(BlindingFactor::FromBytes(std::vector<uint8_t>(32, 1)).IsOk());
        REQUIRE(ReplayKey::FromBytes(std::vector<uint8_t>(32, 1)).IsOk());
        REQUIRE(MacKey::FromBytes(std::vector<uint8_t>(16, 1)).UnwrapErr().type ==
                CryptoFailureType::InvalidLength);
        REQUIRE(BlindingFactor::FromBytes(std::vector<uint8_t>(31, 1)).UnwrapErr().type ==
                CryptoFailureType::InvalidLength);
        REQUIRE(ReplayKey::FromBytes(std::vector<uint8_t>(33, 1)).UnwrapErr().type ==
                CryptoFailureType::InvalidLength);
    }

    SECTION("Curve material reports a bad encoding") {
        REQUIRE(PrivateScalar::FromBytes(std::vector<uint8_t>(31, 1)).UnwrapErr().type ==
                CryptoFailureType::InvalidEncoding);
        REQUIRE(SharedSecret::FromBytes(std::vector<uint8_t>(16, 1)).UnwrapErr().type ==
                CryptoFailureType::InvalidEncoding);
        REQUIRE(SigningSecret::FromBytes(std::vector<uint8_t>(32, 1)).UnwrapErr().type ==
                CryptoFailureType::InvalidEncoding);
    }
}

TEST_CASE("SecretKey - Ownership", "[models][secret_key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Bytes are kept in secure memory") {
        const std::vector<uint8_t> bytes(32, 0x5c);
        auto key = MacKey::FromBytes(bytes).Unwrap();
        REQUIRE(key.Size() == 32);
        REQUIRE_FALSE(key.GetHandle().IsInvalid());
        REQUIRE(ExposeKey(key) == bytes);
    }

    SECTION("Moving a key leaves the source handle disposed") {
        auto key = MacKey::FromBytes(std::vector<uint8_t>(32, 0x5c)).Unwrap();
        MacKey moved(std::move(key));
        REQUIRE(key.GetHandle().IsInvalid());
        REQUIRE(moved.Size() == 32);
    }

    SECTION("Disposed handle cannot become a key") {
        SecureMemoryHandle disposed;
        auto result = MacKey::FromHandle(std::move(disposed));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidState);
    }

    SECTION("Failure messages do not contain key bytes") {
        auto result = MacKey::FromBytes(std::vector<uint8_t>(31, 'Z'));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().message.find("ZZZZ") == std::string::npos);
    }
}
