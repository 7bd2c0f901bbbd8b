#include <catch2/catch_test_macros.hpp>
#include "mixcore/crypto/x25519.hpp"
#include "mixcore/crypto/sodium_interop.hpp"
#include "mixcore/crypto/sodium_secure_random.hpp"
#include "helpers/deterministic_random.hpp"
#include "helpers/secret_bytes.hpp"
#include "helpers/test_vectors.hpp"
#include <array>
#include <vector>

using namespace mixcore;
using namespace mixcore::crypto;
using namespace mixcore::models;
using namespace mixcore::test_helpers;

TEST_CASE("X25519 - RFC 7748 vectors", "[x25519][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto alice_scalar = PrivateScalar::FromBytes(FromHex(rfc7748::ALICE_PRIVATE)).Unwrap();
    auto bob_scalar = PrivateScalar::FromBytes(FromHex(rfc7748::BOB_PRIVATE)).Unwrap();

    SECTION("Public points match") {
        auto alice_public = X25519::DerivePublicPoint(alice_scalar);
        auto bob_public = X25519::DerivePublicPoint(bob_scalar);
        REQUIRE(alice_public.IsOk());
        REQUIRE(bob_public.IsOk());

        auto expected_alice = FromHex(rfc7748::ALICE_PUBLIC);
        auto expected_bob = FromHex(rfc7748::BOB_PUBLIC);
        REQUIRE(std::vector<uint8_t>(alice_public.Unwrap().GetBytes().begin(),
                                     alice_public.Unwrap().GetBytes().end()) == expected_alice);
        REQUIRE(std::vector<uint8_t>(bob_public.Unwrap().GetBytes().begin(),
                                     bob_public.Unwrap().GetBytes().end()) == expected_bob);
    }

    SECTION("Shared secret matches from both sides") {
        auto alice_public = PublicPoint::FromBytes(FromHex(rfc7748::ALICE_PUBLIC)).Unwrap();
        auto bob_public = PublicPoint::FromBytes(FromHex(rfc7748::BOB_PUBLIC)).Unwrap();

        auto alice_shared = X25519::DiffieHellman(alice_scalar, bob_public);
        auto bob_shared = X25519::DiffieHellman(bob_scalar, alice_public);
        REQUIRE(alice_shared.IsOk());
        REQUIRE(bob_shared.IsOk());

        auto expected = FromHex(rfc7748::SHARED_SECRET);
        REQUIRE(ExposeKey(alice_shared.Unwrap()) == expected);
        REQUIRE(ExposeKey(bob_shared.Unwrap()) == expected);
    }
}

TEST_CASE("X25519 - Key generation", "[x25519][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Generated public point matches its scalar") {
        SodiumSecureRandom random;
        auto key_pair = X25519::GenerateKeyPair(random);
        REQUIRE(key_pair.IsOk());

        auto derived = X25519::DerivePublicPoint(key_pair.Unwrap().GetPrivateScalar());
        REQUIRE(derived.IsOk());
        REQUIRE(derived.Unwrap() == key_pair.Unwrap().GetPublicPoint());
    }

    SECTION("Independent key pairs differ") {
        SodiumSecureRandom random;
        auto first = X25519::GenerateKeyPair(random).Unwrap();
        auto second = X25519::GenerateKeyPair(random).Unwrap();
        REQUIRE_FALSE(first.GetPublicPoint() == second.GetPublicPoint());
    }

    SECTION("Scalar is drawn from the injected source") {
        DeterministicRandom random(0x11);
        auto key_pair = X25519::GenerateKeyPair(random);
        REQUIRE(key_pair.IsOk());
        REQUIRE(random.FillCount() == 1);
    }

    SECTION("Private scalar can be moved out of the pair") {
        SodiumSecureRandom random;
        auto key_pair = X25519::GenerateKeyPair(random).Unwrap();
        const auto public_point = key_pair.GetPublicPoint();
        auto scalar = std::move(key_pair).TakePrivateScalar();
        REQUIRE(scalar.Size() == Constants::X_25519_PRIVATE_KEY_SIZE);
        REQUIRE(X25519::DerivePublicPoint(scalar).Unwrap() == public_point);
    }
}

TEST_CASE("X25519 - Diffie-Hellman symmetry", "[x25519][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SodiumSecureRandom random;

    for (int i = 0; i < 16; ++i) {
        auto alice = X25519::GenerateKeyPair(random).Unwrap();
        auto bob = X25519::GenerateKeyPair(random).Unwrap();

        auto alice_shared = X25519::DiffieHellman(alice.GetPrivateScalar(), bob.GetPublicPoint());
        auto bob_shared = X25519::DiffieHellman(bob.GetPrivateScalar(), alice.GetPublicPoint());
        REQUIRE(alice_shared.IsOk());
        REQUIRE(bob_shared.IsOk());
        REQUIRE(ExposeKey(alice_shared.Unwrap()) == ExposeKey(bob_shared.Unwrap()));
    }
}

TEST_CASE("X25519 - Degenerate peer points", "[x25519][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto scalar = PrivateScalar::FromBytes(FromHex(rfc7748::ALICE_PRIVATE)).Unwrap();

    SECTION("All-zero point") {
        PublicPoint zero(PublicPoint::Bytes{});
        auto result = X25519::DiffieHellman(scalar, zero);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::KeyExchange);
    }

    SECTION("Order-8 point") {
        auto point = PublicPoint::FromBytes(
            FromHex("e0eb7a7c3b41b8ae1656e3faf19fc46ada098deb9c32b1fd866205165f49b800")).Unwrap();
        auto result = X25519::DiffieHellman(scalar, point);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::KeyExchange);
    }

    SECTION("Non-canonical encoding") {
        PublicPoint::Bytes bytes{};
        bytes.fill(0xff);
        bytes[31] = 0x7f;
        auto result = X25519::DiffieHellman(scalar, PublicPoint(bytes));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::KeyExchange);
    }
}

TEST_CASE("X25519 - Public point encoding", "[x25519][models]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Wrong width is rejected") {
        std::vector<uint8_t> short_point(31, 0x09);
        auto result = PublicPoint::FromBytes(short_point);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidEncoding);
    }

    SECTION("Base58 text form decodes to the same point") {
        auto point = PublicPoint::FromBytes(FromHex(rfc7748::BOB_PUBLIC)).Unwrap();
        auto text = point.ToBase58();
        auto decoded = PublicPoint::FromBase58(text);
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == point);
    }

    SECTION("Base58 of the wrong width is rejected") {
        auto result = PublicPoint::FromBase58("2NEpo7TZRRrLZSi2U");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidEncoding);
    }
}

TEST_CASE("X25519 - Blinding", "[x25519][crypto][blinding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    DeterministicRandom random(0x42);

    std::array<uint8_t, 32> first_bytes{};
    std::array<uint8_t, 32> second_bytes{};
    REQUIRE(random.Fill(first_bytes).IsOk());
    REQUIRE(random.Fill(second_bytes).IsOk());
    auto first_factor = BlindingFactor::FromBytes(first_bytes).Unwrap();
    auto second_factor = BlindingFactor::FromBytes(second_bytes).Unwrap();

    auto node = X25519::GenerateKeyPair(random).Unwrap();

    SECTION("Blinding changes the point") {
        auto blinded = X25519::BlindPublicPoint(node.GetPublicPoint(), first_factor);
        REQUIRE(blinded.IsOk());
        REQUIRE_FALSE(blinded.Unwrap() == node.GetPublicPoint());
    }

    SECTION("Blinding factors commute") {
        auto first_then_second = X25519::BlindPublicPoint(
            X25519::BlindPublicPoint(node.GetPublicPoint(), first_factor).Unwrap(), second_factor);
        auto second_then_first = X25519::BlindPublicPoint(
            X25519::BlindPublicPoint(node.GetPublicPoint(), second_factor).Unwrap(), first_factor);
        REQUIRE(first_then_second.IsOk());
        REQUIRE(second_then_first.IsOk());
        REQUIRE(first_then_second.Unwrap() == second_then_first.Unwrap());
    }

    SECTION("Node sees the same secret as a sender using the blinded point") {
        // n * (b * xG) == b * (x * nG)
        auto sender = X25519::GenerateKeyPair(random).Unwrap();
        auto blinded_sender = X25519::BlindPublicPoint(sender.GetPublicPoint(), first_factor).Unwrap();
        auto node_side = X25519::DiffieHellman(node.GetPrivateScalar(), blinded_sender);
        REQUIRE(node_side.IsOk());

        auto unblinded_shared = X25519::DiffieHellman(sender.GetPrivateScalar(), node.GetPublicPoint());
        REQUIRE(unblinded_shared.IsOk());
        auto shared_point = PublicPoint::FromBytes(ExposeKey(unblinded_shared.Unwrap())).Unwrap();
        auto sender_side = X25519::BlindPublicPoint(shared_point, first_factor);
        REQUIRE(sender_side.IsOk());

        const auto& expected = sender_side.Unwrap().GetBytes();
        REQUIRE(ExposeKey(node_side.Unwrap()) == std::vector<uint8_t>(expected.begin(), expected.end()));
    }

    SECTION("Blinding a degenerate point fails") {
        PublicPoint zero(PublicPoint::Bytes{});
        auto result = X25519::BlindPublicPoint(zero, first_factor);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::KeyExchange);
    }
}
