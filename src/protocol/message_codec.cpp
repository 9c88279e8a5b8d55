#include "protocol/message_codec.h"

#include <utility>

using json = nlohmann::json;

MessageCodec::MessageCodec(ChannelKey key) : crypto_(std::move(key)) {}

std::string MessageCodec::encode(const MessageContent& content, const DeviceInfo& sender) const {
    json content_json;
    to_json(content_json, content);

    json envelope;
    envelope["content"] = std::move(content_json);
    envelope["sender"] = sender;

    return crypto_.encrypt(envelope.dump());
}

ReceivedMessage MessageCodec::decode(const std::string& bytes) const {
    if (bytes.empty()) {
        throw DecodeError("empty frame");
    }

    std::string plaintext;
    if (!crypto_.decrypt(bytes, plaintext)) {
        throw DecodeError("frame failed authentication (" + std::to_string(bytes.size()) + " bytes)");
    }

    try {
        const auto envelope = json::parse(plaintext);
        ReceivedMessage message;
        from_json(envelope.at("content"), message.content);
        envelope.at("sender").get_to(message.sender);
        return message;
    } catch (const json::exception& e) {
        throw DecodeError(std::string("malformed envelope: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw DecodeError(std::string("malformed envelope: ") + e.what());
    }
}
