#include "mixcore/crypto/aes_ctr.hpp"
#include "mixcore/crypto/sodium_interop.hpp"
#include "mixcore/debug/trace_logger.hpp"
#include "mixcore/core/constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <fmt/core.h>
#include <algorithm>
#include <climits>
#include <memory>
namespace mixcore::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    const EVP_CIPHER* CipherForKeySize(const size_t key_size) noexcept {
        switch (key_size) {
            case Constants::AES_128_KEY_SIZE:
                return EVP_aes_128_ctr();
            case Constants::AES_256_KEY_SIZE:
                return EVP_aes_256_ctr();
            default:
                return nullptr;
        }
    }
    // input and output may alias exactly; CTR is a byte-wise XOR
    Result<Unit, CryptoFailure> Transform(
        std::span<const uint8_t> key,
        const CtrNonce& nonce,
        const uint8_t* input,
        uint8_t* output,
        const size_t length) {
        const EVP_CIPHER* cipher = CipherForKeySize(key.size());
        if (cipher == nullptr) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::InvalidLength(
                    fmt::format("AES-CTR key must be {} or {} bytes, got {}",
                        Constants::AES_128_KEY_SIZE, Constants::AES_256_KEY_SIZE, key.size())));
        }
        if (length == 0) {
            return Result<Unit, CryptoFailure>::Ok(unit);
        }
        EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::Backend(
                    fmt::format("Failed to create cipher context: {}", GetOpenSSLError())));
        }
        if (EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, key.data(), nonce.GetBytes().data())
            != OpenSSL::SUCCESS) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::Backend(
                    fmt::format("Failed to initialize AES-CTR: {}", GetOpenSSLError())));
        }
        size_t offset = 0;
        while (offset < length) {
            const int chunk = static_cast<int>(std::min<size_t>(length - offset, INT_MAX));
            int written = 0;
            if (EVP_EncryptUpdate(ctx.get(), output + offset, &written, input + offset, chunk)
                != OpenSSL::SUCCESS || written != chunk) {
                return Result<Unit, CryptoFailure>::Err(
                    CryptoFailure::Backend(
                        fmt::format("AES-CTR transform failed: {}", GetOpenSSLError())));
            }
            offset += static_cast<size_t>(written);
        }
        int final_len = 0;
        if (EVP_EncryptFinal_ex(ctx.get(), output + offset, &final_len) != OpenSSL::SUCCESS) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::Backend(
                    fmt::format("AES-CTR finalization failed: {}", GetOpenSSLError())));
        }
        return Result<Unit, CryptoFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, CryptoFailure> AesCtr::Encrypt(
    const models::EncryptionKey& key,
    const CtrNonce& nonce,
    std::span<const uint8_t> plaintext) {
    MIXCORE_TRACE_VALUE("AES-CTR", "length", plaintext.size());
    std::vector<uint8_t> output(plaintext.size());
    auto result = FlattenAccess(key.GetHandle().WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return Transform(key_bytes, nonce, plaintext.data(), output.data(), plaintext.size());
    }));
    if (result.IsErr()) {
        SodiumInterop::SecureWipe(output);
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, CryptoFailure> AesCtr::Decrypt(
    const models::EncryptionKey& key,
    const CtrNonce& nonce,
    std::span<const uint8_t> ciphertext) {
    return Encrypt(key, nonce, ciphertext);
}
Result<Unit, CryptoFailure> AesCtr::ApplyInPlace(
    const models::EncryptionKey& key,
    const CtrNonce& nonce,
    std::span<uint8_t> data) {
    MIXCORE_TRACE_VALUE("AES-CTR", "in_place_length", data.size());
    return FlattenAccess(key.GetHandle().WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return Transform(key_bytes, nonce, data.data(), data.data(), data.size());
    }));
}
}
