#include <catch2/catch_test_macros.hpp>
#include "mixcore/crypto/hkdf.hpp"
#include "mixcore/crypto/key_derivation.hpp"
#include "mixcore/crypto/sodium_interop.hpp"
#include "mixcore/crypto/x25519.hpp"
#include "mixcore/crypto/sodium_secure_random.hpp"
#include "helpers/secret_bytes.hpp"
#include "helpers/test_vectors.hpp"
#include <sodium.h>
#include <algorithm>
#include <array>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace mixcore;
using namespace mixcore::crypto;
using namespace mixcore::models;
using namespace mixcore::test_helpers;

TEST_CASE("HKDF Weak Input Material", "[security][hkdf][weak-input]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("All-zero IKM still derives deterministically") {
        std::vector<uint8_t> weak_ikm(32, 0x00);
        std::vector<uint8_t> output1(32);
        std::vector<uint8_t> output2(32);
        REQUIRE(Hkdf::DeriveKey(weak_ikm, output1).IsOk());
        REQUIRE(Hkdf::DeriveKey(weak_ikm, output2).IsOk());
        REQUIRE(output1 == output2);
        REQUIRE_FALSE(SodiumInterop::IsAllZero(output1));
    }

    SECTION("Low entropy IKM with different salts produces different outputs") {
        std::vector<uint8_t> weak_ikm(32, 0xAA);
        std::vector<uint8_t> salt1(16, 0x01);
        std::vector<uint8_t> salt2(16, 0x02);
        std::vector<uint8_t> output1(32);
        std::vector<uint8_t> output2(32);
        REQUIRE(Hkdf::DeriveKey(weak_ikm, output1, salt1).IsOk());
        REQUIRE(Hkdf::DeriveKey(weak_ikm, output2, salt2).IsOk());
        REQUIRE(output1 != output2);
    }

    SECTION("Single byte IKM works") {
        std::vector<uint8_t> minimal_ikm = {0x42};
        std::vector<uint8_t> output(32);
        REQUIRE(Hkdf::DeriveKey(minimal_ikm, output).IsOk());
    }
}

TEST_CASE("HKDF Info String Manipulation", "[security][hkdf][info-manipulation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> ikm(32, 0x17);

    SECTION("Info prefix produces a different output") {
        std::vector<uint8_t> output1(32);
        std::vector<uint8_t> output2(32);
        REQUIRE(Hkdf::DeriveKey(ikm, output1, {}, ToBytes("hop")).IsOk());
        REQUIRE(Hkdf::DeriveKey(ikm, output2, {}, ToBytes("hop-0")).IsOk());
        REQUIRE(output1 != output2);
    }

    SECTION("Large info string (1KB) works") {
        std::vector<uint8_t> info(1024, 0x61);
        std::vector<uint8_t> output(32);
        REQUIRE(Hkdf::DeriveKey(ikm, output, {}, info).IsOk());
    }
}

TEST_CASE("Key derivation domain separation", "[security][key_derivation][domain-separation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SodiumSecureRandom random;
    const std::array<size_t, 1> lengths{32};

    SECTION("Distinct contexts never collide over many secrets") {
        for (int i = 0; i < 64; ++i) {
            std::array<uint8_t, 32> secret_bytes{};
            REQUIRE(random.Fill(secret_bytes).IsOk());
            auto secret = SharedSecret::FromBytes(secret_bytes).Unwrap();

            auto enc = KeyDerivation::Derive(secret, "hop-0/enc", lengths).Unwrap().Take(0).Unwrap();
            auto mac = KeyDerivation::Derive(secret, "hop-0/mac", lengths).Unwrap().Take(0).Unwrap();
            REQUIRE(ExposeBytes(enc) != ExposeBytes(mac));
        }
    }

    SECTION("Every role label of a hop yields a unique key") {
        std::array<uint8_t, 32> secret_bytes{};
        REQUIRE(random.Fill(secret_bytes).IsOk());
        auto secret = SharedSecret::FromBytes(secret_bytes).Unwrap();

        std::set<std::vector<uint8_t>> seen;
        for (const std::string hop : {"hop-0", "hop-1", "hop-2"}) {
            for (const std::string role : {"enc", "mac", "blind", "replay", "nonce"}) {
                auto key = KeyDerivation::Derive(secret, hop + "/" + role, lengths)
                    .Unwrap().Take(0).Unwrap();
                REQUIRE(seen.insert(ExposeBytes(key)).second);
            }
        }
    }

    SECTION("Two parties with the same secret derive the same keys") {
        auto alice = X25519::GenerateKeyPair(random).Unwrap();
        auto bob = X25519::GenerateKeyPair(random).Unwrap();
        auto alice_secret = X25519::DiffieHellman(alice.GetPrivateScalar(), bob.GetPublicPoint()).Unwrap();
        auto bob_secret = X25519::DiffieHellman(bob.GetPrivateScalar(), alice.GetPublicPoint()).Unwrap();

        auto alice_keys = KeyDerivation::DeriveHopKeys(alice_secret, "hop-0").Unwrap();
        auto bob_keys = KeyDerivation::DeriveHopKeys(bob_secret, "hop-0").Unwrap();
        REQUIRE(ExposeKey(alice_keys.GetEncryptionKey()) == ExposeKey(bob_keys.GetEncryptionKey()));
        REQUIRE(ExposeKey(alice_keys.GetMacKey()) == ExposeKey(bob_keys.GetMacKey()));
        REQUIRE(alice_keys.GetNonceSequence().At(7) == bob_keys.GetNonceSequence().At(7));
    }
}

TEST_CASE("HKDF Concurrent Derivation Safety", "[security][hkdf][concurrency]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Concurrent derivations with different IKM produce distinct outputs") {
        constexpr size_t num_threads = 32;

        std::vector<std::thread> threads;
        std::vector<std::vector<uint8_t>> results(num_threads, std::vector<uint8_t>(32));
        std::vector<uint8_t> succeeded(num_threads, 0);

        std::vector<uint8_t> base_ikm(32);
        randombytes_buf(base_ikm.data(), base_ikm.size());

        for (size_t i = 0; i < num_threads; ++i) {
            threads.emplace_back([i, &base_ikm, &results, &succeeded]() {
                std::vector<uint8_t> ikm = base_ikm;
                ikm[0] = static_cast<uint8_t>(i);
                succeeded[i] = Hkdf::DeriveKey(ikm, results[i]).IsOk() ? 1 : 0;
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        for (size_t i = 0; i < num_threads; ++i) {
            REQUIRE(succeeded[i] == 1);
            for (size_t j = i + 1; j < num_threads; ++j) {
                REQUIRE(results[i] != results[j]);
            }
        }
    }
}
