#pragma once
#include "mixcore/crypto/nonce_sequence.hpp"
#include "mixcore/models/key_materials/secret_key.hpp"
namespace mixcore::models {
/// Keys one hop needs to process its layer of a packet.
class HopKeys {
public:
    HopKeys(
        EncryptionKey encryption_key,
        MacKey mac_key,
        BlindingFactor blinding_factor,
        ReplayKey replay_key,
        crypto::NonceSequence nonce_sequence) noexcept
        : encryption_key_(std::move(encryption_key))
        , mac_key_(std::move(mac_key))
        , blinding_factor_(std::move(blinding_factor))
        , replay_key_(std::move(replay_key))
        , nonce_sequence_(std::move(nonce_sequence)) {
    }
    HopKeys(HopKeys&&) noexcept = default;
    HopKeys& operator=(HopKeys&&) noexcept = default;
    HopKeys(const HopKeys&) = delete;
    HopKeys& operator=(const HopKeys&) = delete;
    [[nodiscard]] const EncryptionKey& GetEncryptionKey() const noexcept {
        return encryption_key_;
    }
    [[nodiscard]] const MacKey& GetMacKey() const noexcept {
        return mac_key_;
    }
    [[nodiscard]] const BlindingFactor& GetBlindingFactor() const noexcept {
        return blinding_factor_;
    }
    [[nodiscard]] const ReplayKey& GetReplayKey() const noexcept {
        return replay_key_;
    }
    [[nodiscard]] crypto::NonceSequence& GetNonceSequence() noexcept {
        return nonce_sequence_;
    }
    [[nodiscard]] const crypto::NonceSequence& GetNonceSequence() const noexcept {
        return nonce_sequence_;
    }
private:
    EncryptionKey encryption_key_;
    MacKey mac_key_;
    BlindingFactor blinding_factor_;
    ReplayKey replay_key_;
    crypto::NonceSequence nonce_sequence_;
};
}
