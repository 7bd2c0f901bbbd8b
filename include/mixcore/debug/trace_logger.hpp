#pragma once

/**
 * @file trace_logger.hpp
 * @brief Debug tracing for key agreement and derivation steps.
 *
 * Only public material is ever traced: public points, verifying keys,
 * context labels and lengths. No macro here accepts a SecureMemoryHandle.
 *
 * Enable via CMake: -DMIXCORE_DEBUG_TRACE=ON
 */

#include "mixcore/core/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace mixcore::debug {

#ifdef MIXCORE_DEBUG_TRACE

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = Constants::TRACE_HEX_MAX_BYTES) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

// ============================================================================
// Core tracing macros
// ============================================================================

#define MIXCORE_TRACE_PUBLIC(operation, name, data) \
    do { \
        fprintf(stdout, "[MIXCORE-TRACE] %s %s: %s\n", \
            operation, \
            name, \
            ::mixcore::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define MIXCORE_TRACE_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[MIXCORE-TRACE] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define MIXCORE_TRACE_MSG(operation, message) \
    do { \
        fprintf(stdout, "[MIXCORE-TRACE] %s %s\n", \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Operation tracing
// ============================================================================

inline void LogDerivation(std::string_view context, size_t key_count, size_t total_length) {
    const std::string label(context);
    MIXCORE_TRACE_MSG("KDF", ("context=" + label).c_str());
    MIXCORE_TRACE_VALUE("KDF", "key_count", key_count);
    MIXCORE_TRACE_VALUE("KDF", "total_length", total_length);
}

inline void LogKeyAgreement(std::span<const uint8_t> peer_public) {
    MIXCORE_TRACE_PUBLIC("X25519", "peer_public", peer_public);
}

#else // !MIXCORE_DEBUG_TRACE

#define MIXCORE_TRACE_PUBLIC(operation, name, data) ((void)0)
#define MIXCORE_TRACE_VALUE(operation, name, value) ((void)0)
#define MIXCORE_TRACE_MSG(operation, message) ((void)0)

inline void LogDerivation(std::string_view, size_t, size_t) {}
inline void LogKeyAgreement(std::span<const uint8_t>) {}

#endif // MIXCORE_DEBUG_TRACE

} // namespace mixcore::debug
