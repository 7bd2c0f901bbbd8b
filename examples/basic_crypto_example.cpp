/**
 * @file basic_crypto_example.cpp
 * @brief One hop of key agreement, derivation, encryption and tagging
 */

#include "mixcore/crypto/aes_ctr.hpp"
#include "mixcore/crypto/ed25519.hpp"
#include "mixcore/crypto/integrity_tag.hpp"
#include "mixcore/crypto/key_derivation.hpp"
#include "mixcore/crypto/sodium_interop.hpp"
#include "mixcore/crypto/sodium_secure_random.hpp"
#include "mixcore/crypto/x25519.hpp"

#include <fmt/core.h>

#include <string_view>
#include <vector>

using namespace mixcore;
using namespace mixcore::crypto;

namespace {
int Fail(std::string_view step, const CryptoFailure& failure) {
    fmt::print(stderr, "{} failed: [{}] {}\n", step, ToString(failure.type), failure.message);
    return 1;
}
}

int main() {
    fmt::print("=== mixcore - Basic Crypto Example ===\n\n");

    fmt::print("1. Initializing libsodium...\n");
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        fmt::print(stderr, "Failed to initialize: {}\n", init_result.UnwrapErr().message);
        return 1;
    }
    fmt::print("   Initialized\n\n");

    SodiumSecureRandom random;

    fmt::print("2. Generating node and sender X25519 key pairs...\n");
    auto node_result = X25519::GenerateKeyPair(random);
    if (node_result.IsErr()) {
        return Fail("Node key generation", node_result.UnwrapErr());
    }
    auto sender_result = X25519::GenerateKeyPair(random);
    if (sender_result.IsErr()) {
        return Fail("Sender key generation", sender_result.UnwrapErr());
    }
    const auto& node = node_result.Unwrap();
    const auto& sender = sender_result.Unwrap();
    fmt::print("   Node public key:   {}\n", node.GetPublicPoint().ToBase58());
    fmt::print("   Sender public key: {}\n\n", sender.GetPublicPoint().ToBase58());

    fmt::print("3. Signing the node's public key with its identity key...\n");
    auto identity_result = Ed25519::GenerateKeyPair(random);
    if (identity_result.IsErr()) {
        return Fail("Identity key generation", identity_result.UnwrapErr());
    }
    const auto& identity = identity_result.Unwrap();
    auto signature_result = Ed25519::Sign(identity, node.GetPublicPoint().AsSpan());
    if (signature_result.IsErr()) {
        return Fail("Signing", signature_result.UnwrapErr());
    }
    auto verify_result = Ed25519::Verify(
        identity.GetVerifyingKey(), node.GetPublicPoint().AsSpan(), signature_result.Unwrap());
    if (verify_result.IsErr()) {
        return Fail("Signature verification", verify_result.UnwrapErr());
    }
    fmt::print("   Identity key {} vouches for the node key\n\n", identity.GetVerifyingKey().ToBase58());

    fmt::print("4. Agreeing on a shared secret and deriving hop keys...\n");
    auto sender_secret = X25519::DiffieHellman(sender.GetPrivateScalar(), node.GetPublicPoint());
    if (sender_secret.IsErr()) {
        return Fail("Sender key agreement", sender_secret.UnwrapErr());
    }
    auto node_secret = X25519::DiffieHellman(node.GetPrivateScalar(), sender.GetPublicPoint());
    if (node_secret.IsErr()) {
        return Fail("Node key agreement", node_secret.UnwrapErr());
    }
    auto sender_keys = KeyDerivation::DeriveHopKeys(sender_secret.Unwrap(), "hop-0");
    if (sender_keys.IsErr()) {
        return Fail("Sender key derivation", sender_keys.UnwrapErr());
    }
    auto node_keys = KeyDerivation::DeriveHopKeys(node_secret.Unwrap(), "hop-0");
    if (node_keys.IsErr()) {
        return Fail("Node key derivation", node_keys.UnwrapErr());
    }
    fmt::print("   Encryption key: {} bytes, MAC key: {} bytes [SECURE]\n\n",
        sender_keys.Unwrap().GetEncryptionKey().Size(), sender_keys.Unwrap().GetMacKey().Size());

    fmt::print("5. Encrypting and tagging a payload...\n");
    const std::string_view text = "meet at the usual place";
    const std::vector<uint8_t> payload(text.begin(), text.end());
    auto nonce = sender_keys.Unwrap().GetNonceSequence().Next();
    if (nonce.IsErr()) {
        return Fail("Nonce issuance", nonce.UnwrapErr());
    }
    auto ciphertext = AesCtr::Encrypt(sender_keys.Unwrap().GetEncryptionKey(), nonce.Unwrap(), payload);
    if (ciphertext.IsErr()) {
        return Fail("Encryption", ciphertext.UnwrapErr());
    }
    auto tag = IntegrityTag::Compute(sender_keys.Unwrap().GetMacKey(),
        std::span<const uint8_t>(ciphertext.Unwrap()));
    if (tag.IsErr()) {
        return Fail("Tagging", tag.UnwrapErr());
    }
    fmt::print("   {} bytes encrypted and tagged\n\n", ciphertext.Unwrap().size());

    fmt::print("6. Node verifies and decrypts...\n");
    auto check = IntegrityTag::VerifyOrFail(node_keys.Unwrap().GetMacKey(), ciphertext.Unwrap(), tag.Unwrap());
    if (check.IsErr()) {
        return Fail("Tag verification", check.UnwrapErr());
    }
    const auto node_nonce = node_keys.Unwrap().GetNonceSequence().At(0);
    auto plaintext = AesCtr::Decrypt(node_keys.Unwrap().GetEncryptionKey(), node_nonce, ciphertext.Unwrap());
    if (plaintext.IsErr()) {
        return Fail("Decryption", plaintext.UnwrapErr());
    }
    const auto& recovered = plaintext.Unwrap();
    fmt::print("   Recovered: \"{}\"\n\n", std::string_view(
        reinterpret_cast<const char*>(recovered.data()), recovered.size()));

    fmt::print("7. Corrupting one ciphertext byte...\n");
    auto corrupted = ciphertext.Unwrap();
    corrupted[0] ^= 0x01;
    if (IntegrityTag::Verify(node_keys.Unwrap().GetMacKey(), corrupted, tag.Unwrap())) {
        fmt::print(stderr, "Corrupted ciphertext was accepted\n");
        return 1;
    }
    fmt::print("   Rejected\n\n");

    fmt::print("=== Example completed successfully ===\n\n");
    fmt::print("Note: All secure memory is automatically freed when handles\n");
    fmt::print("      go out of scope (RAII).\n");

    return 0;
}
