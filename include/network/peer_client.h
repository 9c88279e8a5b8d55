#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "network/framed_socket.h"
#include "network/http_message.h"
#include "network/socket_type.h"

/**
 * Outbound side of the channel for the client role.
 *
 * Every call is a single attempt; retrying is up to the caller.
 */
class PeerClient {
public:
    using PingCallback    = std::function<void(std::optional<HttpResponse> response)>;
    using ConnectCallback = std::function<void(const asio::error_code& ec,
                                               std::shared_ptr<FramedSocket> socket)>;

    explicit PeerClient(asio::io_context& io);

    /// Send one liveness probe and read the whole response.
    /// The callback gets nullopt on connect failure, timeout or garbage.
    void ping_server(const std::string& address, uint16_t port,
                     const std::string& ping_request,
                     std::chrono::milliseconds timeout,
                     PingCallback cb);

    /// Perform the upgrade handshake for `type` on the socket path.
    void connect_to_socket(const std::string& ip, uint16_t port, SocketType type,
                           const std::map<std::string, std::string>& headers,
                           std::chrono::milliseconds timeout,
                           ConnectCallback cb);

private:
    asio::io_context& io_;
};
