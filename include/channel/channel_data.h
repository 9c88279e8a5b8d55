#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include <asio.hpp>

#include "crypto/crypto_manager.h"
#include "network/http_message.h"
#include "protocol/message.h"

/**
 * Settings of one channel, fixed for the duration of a start_socket call.
 */
struct ChannelConfig {
    uint16_t port = 4045;
    std::chrono::milliseconds reconnect_interval{5000};
    std::chrono::milliseconds probe_timeout{3000};
    ChannelKey key = ChannelKey::defaults();

    /// Sees every request on the listening port before it is routed.
    std::function<void(const HttpRequest&)> request_observer;
};

/**
 * Receives everything that arrives on the message socket.
 */
struct MessagesListener {
    std::function<void(const ReceivedMessage&)> on_data;
    std::function<void()> on_created;
    std::function<void()> on_done;
    std::function<void(const asio::error_code&)> on_error;

    /// Drop the subscription on the first socket error.
    bool cancel_on_error = false;
};

enum class TransferDirection {
    Request,   // this side offered the files
    Response,  // this side answered the offer
};

enum class TransferStatus {
    Pending,         // offer seen, no accepted answer yet
    AwaitingSocket,  // accepted, waiting for the peer to connect
    Open,            // file socket attached
};

struct FileTransferSession {
    std::string transfer_id;
    TransferDirection direction = TransferDirection::Request;
    std::string peer_id;
    TransferStatus status = TransferStatus::Pending;
};

/**
 * Sink for file sockets. Chunking and retry of file payloads happen here,
 * outside the channel.
 */
struct FilesListener {
    std::function<void(const FileTransferSession&)> on_created;
    std::function<void(const std::string& transfer_id, const std::string& chunk)> on_data;
    std::function<void(const std::string& transfer_id)> on_closed;
    std::function<void(const std::string& transfer_id, const asio::error_code&)> on_error;
};

/// Everything start_socket needs.
struct ChannelData {
    std::string connected_device_id;
    ChannelConfig config;
    MessagesListener messages_listener;
    FilesListener files_listener;
};
