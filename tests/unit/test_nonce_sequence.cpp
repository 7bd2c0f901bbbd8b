#include <catch2/catch_test_macros.hpp>
#include "mixcore/crypto/nonce_sequence.hpp"
#include "mixcore/crypto/sodium_interop.hpp"
#include "helpers/test_vectors.hpp"
#include <limits>
#include <set>
#include <vector>

using namespace mixcore;
using namespace mixcore::crypto;
using namespace mixcore::test_helpers;

namespace {
NonceSequence SequenceFromHex(std::string_view hex) {
    auto handle = SecureMemoryHandle::Allocate(Constants::CTR_NONCE_BASE_SIZE).Unwrap();
    REQUIRE(handle.Write(FromHex(hex)).IsOk());
    return NonceSequence::FromKeyMaterial(handle).Unwrap();
}

std::vector<uint8_t> BytesOf(const CtrNonce& nonce) {
    return {nonce.GetBytes().begin(), nonce.GetBytes().end()};
}
}

TEST_CASE("NonceSequence - Block layout", "[nonce][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto sequence = SequenceFromHex("0102030405060708");

    SECTION("Index zero is the base followed by a zero counter") {
        REQUIRE(BytesOf(sequence.At(0)) == FromHex("01020304050607080000000000000000"));
    }

    SECTION("Index is XORed big-endian into the base") {
        REQUIRE(BytesOf(sequence.At(1)) == FromHex("01020304050607090000000000000000"));
        REQUIRE(BytesOf(sequence.At(0x0100)) == FromHex("01020304050606080000000000000000"));
        REQUIRE(BytesOf(sequence.At(0xff00000000000000ULL)) ==
                FromHex("fe020304050607080000000000000000"));
    }

    SECTION("Next hands out indices in order") {
        REQUIRE(sequence.Next().Unwrap() == sequence.At(0));
        REQUIRE(sequence.Next().Unwrap() == sequence.At(1));
        REQUIRE(sequence.Next().Unwrap() == sequence.At(2));
        REQUIRE(sequence.Issued() == 3);
    }

    SECTION("Single-use block is all zero") {
        REQUIRE(BytesOf(CtrNonce::ForSingleUseKey()) == std::vector<uint8_t>(16, 0));
    }
}

TEST_CASE("NonceSequence - Sender and receiver roles", "[nonce][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto sender = SequenceFromHex("9b07b12d1da4071c");
    const auto receiver = SequenceFromHex("9b07b12d1da4071c");

    SECTION("Receiver rebuilds each block the sender issued") {
        for (uint64_t i = 0; i < 8; ++i) {
            const auto issued = sender.Next();
            REQUIRE(issued.IsOk());
            REQUIRE(issued.Unwrap() == receiver.At(i));
        }
        REQUIRE(receiver.Issued() == 0);
    }

    SECTION("Rebuilding blocks never advances the sequence") {
        for (uint64_t i = 0; i < 8; ++i) {
            (void)sender.At(i);
        }
        REQUIRE(sender.Issued() == 0);
        REQUIRE(sender.Next().Unwrap() == receiver.At(0));
    }
}

TEST_CASE("NonceSequence - Uniqueness", "[nonce][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto sequence = SequenceFromHex("9b07b12d1da4071c");

    std::set<std::vector<uint8_t>> seen;
    for (int i = 0; i < 4096; ++i) {
        auto nonce = sequence.Next();
        REQUIRE(nonce.IsOk());
        REQUIRE(seen.insert(BytesOf(nonce.Unwrap())).second);
    }
    REQUIRE(sequence.Issued() == 4096);
}

TEST_CASE("NonceSequence - Construction and moves", "[nonce][crypto][boundaries]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Base of the wrong width is rejected") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        auto result = NonceSequence::FromKeyMaterial(handle);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidLength);
    }

    SECTION("Disposed base is rejected") {
        SecureMemoryHandle disposed;
        REQUIRE(NonceSequence::FromKeyMaterial(disposed).IsErr());
    }

    SECTION("Moved-to sequence continues where the source stopped") {
        auto source = SequenceFromHex("0102030405060708");
        REQUIRE(source.Next().IsOk());
        REQUIRE(source.Next().IsOk());

        NonceSequence target(std::move(source));
        REQUIRE(target.Issued() == 2);
        REQUIRE(target.Next().Unwrap() == target.At(2));
    }

    SECTION("Moved-from sequence refuses to issue more blocks") {
        auto source = SequenceFromHex("0102030405060708");
        NonceSequence target(std::move(source));
        auto result = source.Next();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidState);
        REQUIRE(source.Issued() == std::numeric_limits<uint64_t>::max());
    }

    SECTION("Move assignment transfers the position") {
        auto source = SequenceFromHex("0102030405060708");
        auto target = SequenceFromHex("1112131415161718");
        REQUIRE(source.Next().IsOk());
        target = std::move(source);
        REQUIRE(target.Next().Unwrap() == target.At(1));
        REQUIRE(BytesOf(target.At(0)) == FromHex("01020304050607080000000000000000"));
        REQUIRE(source.Next().IsErr());
    }
}
