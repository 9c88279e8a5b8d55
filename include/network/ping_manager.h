#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "network/http_message.h"

/**
 * Builds and recognises liveness probes on the channel port.
 *
 * A ping is `GET /ping?token=<32 hex chars>`; the pong echoes the token as
 * `pong:<token>`. This only tells a ready server apart from other traffic,
 * it proves nothing about who answered.
 */
class PingManager {
public:
    static constexpr std::size_t kTokenBytes = 16;

    /// Fresh random token, hex encoded.
    std::string build_ping() const;

    std::string build_ping_request(const std::string& token,
                                   const std::string& host, uint16_t port) const;

    /// True for a well-formed probe. Anything else is routed normally.
    bool is_ping(const HttpRequest& request) const;

    /// Body the server returns for `token`.
    std::string pong_body(const std::string& token) const;

    /// True if `response` answers the ping that carried `token`.
    bool is_pong(const std::optional<HttpResponse>& response, const std::string& token) const;

private:
    static bool is_token(const std::string& value);
};
