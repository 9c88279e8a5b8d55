#pragma once

#include <asio.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "channel/channel_data.h"
#include "channel/channel_state.h"
#include "channel/file_sockets_manager.h"
#include "group/group_info_provider.h"
#include "network/framed_socket.h"
#include "network/peer_client.h"
#include "network/peer_server.h"
#include "network/ping_manager.h"
#include "protocol/message_codec.h"

/**
 * Communication channel between the two devices of a local group.
 *
 * The group owner listens and waits for the client's `message` upgrade; the
 * client pings the owner every reconnect interval until it answers, then
 * upgrades. Only one channel should exist per session, and it must be
 * created with std::make_shared.
 */
class ChannelManager : public std::enable_shared_from_this<ChannelManager> {
public:
    ChannelManager(asio::io_context& io, GroupInfoProvider& group);
    ~ChannelManager();

    ChannelManager(const ChannelManager&) = delete;
    ChannelManager& operator=(const ChannelManager&) = delete;

    /// Resolve the role and bring the channel up.
    /// Returns false if the group is not formed yet (a retry is scheduled).
    /// Throws asio::system_error if the owner cannot listen on the port.
    bool start_socket(ChannelData data);

    /// Write one message to the peer.
    /// Throws InvalidMessageError for a malformed message. Returns false if
    /// there is no socket, the receiver is not the connected peer, or the
    /// write could not be queued.
    bool send(const OutgoingMessage& message);

    /// Tear everything down. Every step runs even if an earlier one fails.
    bool cancel();

    [[nodiscard]] StateNotifier& state() { return state_; }
    [[nodiscard]] ChannelState state_value() const { return state_.value(); }
    [[nodiscard]] const std::string& connected_device_id() const { return connected_device_id_; }
    [[nodiscard]] FileSocketsManager& file_sockets() { return *file_sockets_; }

    /// Port the owner is listening on, 0 otherwise.
    [[nodiscard]] uint16_t listening_port() const;

private:
    /// Inbound side of the message socket. Inactive subscriptions drop
    /// everything the socket still delivers.
    struct Subscription {
        MessagesListener listener;
        bool active = true;
    };

    void start_server(const ConnectionInfo& info);
    void try_connect_client(const ConnectionInfo& info, uint64_t generation);
    void schedule(uint64_t generation, std::function<void()> action);
    void on_server_request(const std::shared_ptr<IncomingRequest>& request);
    void create_socket_subscription(std::shared_ptr<FramedSocket> socket);
    void on_frame(const std::shared_ptr<Subscription>& subscription, const std::string& frame);
    void on_socket_done(const std::shared_ptr<Subscription>& subscription);
    void on_socket_error(const std::shared_ptr<Subscription>& subscription, const asio::error_code& ec);
    void handle_files_message(const MessageContent& content, bool is_received,
                              const std::optional<DeviceInfo>& peer);
    void release_socket();

    asio::io_context& io_;
    GroupInfoProvider& group_;
    PingManager ping_manager_;
    PeerClient client_;
    std::shared_ptr<FileSocketsManager> file_sockets_;
    std::unique_ptr<MessageCodec> codec_;
    StateNotifier state_;

    ChannelData data_;
    std::string connected_device_id_;
    std::shared_ptr<FramedSocket> socket_;
    std::shared_ptr<PeerServer> server_;
    std::shared_ptr<Subscription> subscription_;
    asio::steady_timer retry_timer_;

    // Bumped by cancel(); scheduled work from older generations is dropped.
    uint64_t generation_ = 0;
};
