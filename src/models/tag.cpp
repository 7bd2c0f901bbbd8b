#include "mixcore/models/tag.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace mixcore::models {

Result<Tag, CryptoFailure> Tag::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::TAG_SIZE) {
        return Result<Tag, CryptoFailure>::Err(
            CryptoFailure::InvalidEncoding(
                fmt::format("Tag must be {} bytes, got {}", Constants::TAG_SIZE, bytes.size())));
    }
    Bytes tag{};
    std::copy(bytes.begin(), bytes.end(), tag.begin());
    return Result<Tag, CryptoFailure>::Ok(Tag(tag));
}

Result<ReplayId, CryptoFailure> ReplayId::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::REPLAY_ID_SIZE) {
        return Result<ReplayId, CryptoFailure>::Err(
            CryptoFailure::InvalidEncoding(
                fmt::format("Replay identifier must be {} bytes, got {}",
                    Constants::REPLAY_ID_SIZE, bytes.size())));
    }
    Bytes id{};
    std::copy(bytes.begin(), bytes.end(), id.begin());
    return Result<ReplayId, CryptoFailure>::Ok(ReplayId(id));
}

}
