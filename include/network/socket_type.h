#pragma once

#include <optional>
#include <string>

#include "network/http_message.h"

/// Paths and headers of the channel port.
inline constexpr const char* kPingPath = "/ping";
inline constexpr const char* kSocketPath = "/ws";
inline constexpr const char* kSocketTypeHeader = "X-Socket-Type";
inline constexpr const char* kTransferIdHeader = "X-Transfer-Id";
inline constexpr const char* kSenderIdHeader = "X-Sender-Id";
inline constexpr const char* kUpgradeProtocol = "nearlink-frames/1";

/**
 * Which pool an upgraded connection belongs to.
 */
enum class SocketType {
    Message,
    File,
};

inline const char* socket_type_name(SocketType type) {
    return type == SocketType::Message ? "message" : "file";
}

inline std::optional<SocketType> socket_type_from_request(const HttpRequest& request) {
    const auto value = to_lower(request.header(kSocketTypeHeader));
    if (value == "message") return SocketType::Message;
    if (value == "file") return SocketType::File;
    return std::nullopt;
}
