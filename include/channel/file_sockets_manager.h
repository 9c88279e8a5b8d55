#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "channel/channel_data.h"
#include "group/group_info_provider.h"
#include "network/framed_socket.h"
#include "network/peer_client.h"
#include "network/peer_server.h"
#include "protocol/message.h"

/**
 * Owns one socket per active file transfer, keyed by the id of the
 * FilesRequest that started it.
 *
 * File sockets use the same port as the message socket but never touch the
 * message subscription or the liveness probes. The client role always dials
 * out; the owner role waits for the peer's `file` upgrade.
 */
class FileSocketsManager : public std::enable_shared_from_this<FileSocketsManager> {
public:
    FileSocketsManager(PeerClient& client, GroupInfoProvider& group);
    ~FileSocketsManager();

    void set_listener(FilesListener listener);
    void set_connection_data(const ChannelConfig& config);

    /// Take over an upgrade request already known to be file-typed.
    void on_ws_request(const std::shared_ptr<IncomingRequest>& request);

    /// Track a files request/response seen on the message socket.
    /// `peer` is the sender of a received message or the receiver of a sent one.
    void handle_file_message_content(const MessageContent& content, bool is_received,
                                     const std::optional<DeviceInfo>& peer);

    /// Write one chunk on the transfer's socket.
    bool send(const std::string& transfer_id, std::string chunk);

    /// Close every file socket and forget all sessions. Safe to repeat.
    void close_all() noexcept;

    [[nodiscard]] std::optional<FileTransferSession> session(const std::string& transfer_id) const;
    [[nodiscard]] std::size_t session_count() const { return sessions_.size(); }
    [[nodiscard]] std::size_t open_socket_count() const;

private:
    struct Entry {
        FileTransferSession session;
        std::shared_ptr<FramedSocket> socket;
    };

    void on_files_request(const FilesRequest& request, bool is_received,
                          const std::optional<DeviceInfo>& peer);
    void on_files_response(const FilesResponse& response, bool is_received,
                           const std::optional<DeviceInfo>& peer);
    void connect_outbound(const std::string& transfer_id, const std::string& owner_address);
    void attach(const std::string& transfer_id, std::shared_ptr<FramedSocket> socket);
    void remove(const std::string& transfer_id);

    PeerClient& client_;
    GroupInfoProvider& group_;
    FilesListener listener_;
    ChannelConfig config_;

    std::map<std::string, Entry> sessions_;
    std::set<std::string> retired_;
    uint64_t generation_ = 0;
};
