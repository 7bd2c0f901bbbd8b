#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace mixcore {
struct Constants {
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t X_25519_SHARED_SECRET_SIZE = 32;
    static constexpr size_t CURVE_25519_FIELD_ELEMENT_SIZE = 32;
    static constexpr uint8_t CURVE_25519_TOP_BIT_MASK = 0x7F;
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SEED_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr uint8_t ED_25519_SIGNATURE_S_HIGH_BITS = 0xE0;
    static constexpr size_t AES_128_KEY_SIZE = 16;
    static constexpr size_t AES_256_KEY_SIZE = 32;
    static constexpr size_t AES_BLOCK_SIZE = 16;
    static constexpr size_t CTR_NONCE_SIZE = AES_BLOCK_SIZE;
    static constexpr size_t CTR_NONCE_BASE_SIZE = 8;
    static constexpr size_t BLAKE3_KEY_SIZE = 32;
    static constexpr size_t BLAKE3_OUT_SIZE = 32;
    static constexpr size_t BLAKE3_BLOCK_SIZE = 64;
    static constexpr size_t MAC_KEY_SIZE = BLAKE3_KEY_SIZE;
    static constexpr size_t TAG_SIZE = BLAKE3_OUT_SIZE;
    static constexpr size_t REPLAY_KEY_SIZE = BLAKE3_KEY_SIZE;
    static constexpr size_t REPLAY_ID_SIZE = BLAKE3_OUT_SIZE;
    static constexpr size_t BLINDING_FACTOR_SIZE = X_25519_PRIVATE_KEY_SIZE;
    static constexpr size_t HKDF_HASH_LEN = BLAKE3_OUT_SIZE;
    static constexpr size_t HKDF_MAX_OUTPUT_LEN = 255 * HKDF_HASH_LEN;
    static constexpr size_t MULTIPART_LENGTH_PREFIX_SIZE = 8;
    static constexpr size_t BASE58_MAX_INPUT_LENGTH = 128;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t TRACE_HEX_MAX_BYTES = 64;
};
struct ContextLabels {
    static constexpr char SEPARATOR = '/';
    static constexpr std::string_view ENCRYPTION = "enc";
    static constexpr std::string_view MAC = "mac";
    static constexpr std::string_view BLINDING = "blind";
    static constexpr std::string_view REPLAY = "replay";
    static constexpr std::string_view NONCE = "nonce";
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int VALID_POINT = 1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view RANDOM_SOURCE_UNAVAILABLE = "Secure random source unavailable";
    static constexpr std::string_view DEGENERATE_SHARED_SECRET = "X25519 produced a degenerate shared secret";
    static constexpr std::string_view EMPTY_CONTEXT = "Derivation context label must not be empty";
    static constexpr std::string_view NONCE_SEQUENCE_EXHAUSTED = "Nonce sequence exhausted - derive fresh hop keys";
};
}
