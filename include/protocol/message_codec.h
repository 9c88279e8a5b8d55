#pragma once

#include <stdexcept>
#include <string>

#include "crypto/crypto_manager.h"
#include "protocol/message.h"

/// A frame that could not be turned back into a ReceivedMessage.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Serializes message envelopes to JSON and seals them with the channel key.
 *
 * Envelope: { "content": { "type": ..., "id": ..., ... }, "sender": { ... } }
 */
class MessageCodec {
public:
    explicit MessageCodec(ChannelKey key = ChannelKey::defaults());

    std::string encode(const MessageContent& content, const DeviceInfo& sender) const;

    /// Throws DecodeError for empty, tampered, mis-keyed or malformed input.
    ReceivedMessage decode(const std::string& bytes) const;

private:
    CryptoManager crypto_;
};
