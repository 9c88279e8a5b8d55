/**
 * ChannelManager — role selection, handshake and lifetime of the message
 * socket.
 *
 * Owner:  PeerServer on the owner address; pings are answered, `message`
 *         upgrades become the channel socket, `file` upgrades go to the
 *         FileSocketsManager.
 * Client: ping the owner, upgrade on a valid pong, otherwise retry after
 *         the reconnect interval for as long as the state stays Loading.
 */

#include "channel/channel_manager.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

#include "network/socket_type.h"

namespace {

// Listener code is not allowed to unwind through the io_context.
template <class Fn>
void notify(const char* what, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        spdlog::error("Channel: {} listener failed: {}", what, e.what());
    }
}

} // namespace

ChannelManager::ChannelManager(asio::io_context& io, GroupInfoProvider& group)
    : io_(io),
      group_(group),
      client_(io),
      file_sockets_(std::make_shared<FileSocketsManager>(client_, group)),
      codec_(std::make_unique<MessageCodec>()),
      retry_timer_(io) {}

ChannelManager::~ChannelManager() {
    ++generation_;
    if (subscription_) subscription_->active = false;
    if (socket_) socket_->close();
    if (server_) server_->stop();
    file_sockets_->set_listener(FilesListener{});
    file_sockets_->close_all();
    retry_timer_.cancel();
}

bool ChannelManager::start_socket(ChannelData data) {
    state_.set(ChannelState::Loading);

    data_ = std::move(data);
    connected_device_id_ = data_.connected_device_id;
    codec_ = std::make_unique<MessageCodec>(data_.config.key);

    file_sockets_->set_listener(data_.files_listener);
    file_sockets_->set_connection_data(data_.config);

    const auto generation = generation_;
    auto info = group_.connection_info();

    if (info && info->group_formed) {
        if (info->is_group_owner) {
            try {
                start_server(*info);
            } catch (const asio::system_error& e) {
                spdlog::error("Channel: cannot listen on port {}: {}", data_.config.port, e.what());
                state_.set(ChannelState::NotConnected);
                throw;
            }
        } else {
            try_connect_client(*info, generation);
        }
        return true;
    }

    spdlog::info("Channel: group not formed yet, retrying in {} ms",
                 data_.config.reconnect_interval.count());
    schedule(generation, [this, retry = data_]() {
        try {
            start_socket(retry);
        } catch (const asio::system_error& e) {
            if (retry.messages_listener.on_error) {
                notify("error", [&]() { retry.messages_listener.on_error(e.code()); });
            }
        }
    });
    return false;
}

bool ChannelManager::send(const OutgoingMessage& message) {
    if (!message.is_valid()) {
        throw InvalidMessageError(message.content);
    }

    spdlog::debug("Channel: send {} to {} (connected device {})",
                  content_type_name(message.content), message.receiver.id, connected_device_id_);

    if (!socket_ || !socket_->is_open() || message.receiver.id != connected_device_id_) {
        return false;
    }

    auto sender = group_.current_device();
    if (!sender) {
        spdlog::error("Channel: current device unknown, message not sent");
        return false;
    }

    try {
        if (!socket_->send(codec_->encode(message.content, *sender))) {
            spdlog::warn("Channel: message {} not queued", content_id(message.content));
            return false;
        }
        handle_files_message(message.content, false, message.receiver);
    } catch (const std::exception& e) {
        spdlog::error("Channel: send failed: {}", e.what());
        return false;
    }
    return true;
}

bool ChannelManager::cancel() {
    bool ok = true;
    ++generation_;

    auto step = [&ok](const char* what, const std::function<void()>& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::error("Channel: {} failed during cancel: {}", what, e.what());
            ok = false;
        }
    };

    step("subscription cancel", [this]() {
        if (subscription_) {
            subscription_->active = false;
            subscription_.reset();
        }
    });
    step("file sockets close", [this]() { file_sockets_->close_all(); });
    step("socket close", [this]() {
        if (socket_) {
            socket_->close();
            socket_.reset();
        }
    });
    step("server close", [this]() {
        if (server_) {
            server_->stop();
            server_.reset();
        }
    });
    step("retry cancel", [this]() { retry_timer_.cancel(); });

    connected_device_id_.clear();
    state_.set(ChannelState::NotConnected);
    return ok;
}

uint16_t ChannelManager::listening_port() const {
    return server_ && server_->is_listening() ? server_->port() : 0;
}

void ChannelManager::start_server(const ConnectionInfo& info) {
    if (server_) {
        server_->stop();
        server_.reset();
    }

    auto server = std::make_shared<PeerServer>(io_);
    std::weak_ptr<ChannelManager> weak = weak_from_this();
    const auto generation = generation_;
    const PeerServer* owner = server.get();
    server->set_on_request([weak, generation, owner](std::shared_ptr<IncomingRequest> request) {
        auto self = weak.lock();
        if (!self || generation != self->generation_ || self->server_.get() != owner) {
            spdlog::debug("Channel: dropping request for a stopped server");
            return;
        }
        self->on_server_request(request);
    });

    server->start(info.owner_address, data_.config.port);
    server_ = std::move(server);
}

void ChannelManager::try_connect_client(const ConnectionInfo& info, uint64_t generation) {
    if (generation != generation_ || state_.value() != ChannelState::Loading) {
        return;
    }
    state_.set(ChannelState::Loading);

    const auto& config = data_.config;
    const auto token = ping_manager_.build_ping();
    std::weak_ptr<ChannelManager> weak = weak_from_this();

    auto retry = [weak, info, generation]() {
        auto self = weak.lock();
        if (!self) return;
        spdlog::debug("Channel: retry to connect to the server in {} ms",
                      self->data_.config.reconnect_interval.count());
        self->schedule(generation, [self = self.get(), info, generation]() {
            self->try_connect_client(info, generation);
        });
    };

    client_.ping_server(info.owner_address, config.port,
                        ping_manager_.build_ping_request(token, info.owner_address, config.port),
                        config.probe_timeout,
        [weak, info, generation, token, retry](std::optional<HttpResponse> response) {
            auto self = weak.lock();
            if (!self || generation != self->generation_ ||
                self->state_.value() != ChannelState::Loading) {
                return;
            }
            if (!self->ping_manager_.is_pong(response, token)) {
                retry();
                return;
            }

            spdlog::debug("Channel: got pong from {}", info.owner_address);
            self->client_.connect_to_socket(info.owner_address, self->data_.config.port,
                                            SocketType::Message, {}, self->data_.config.probe_timeout,
                [weak, generation, retry](const asio::error_code& ec, std::shared_ptr<FramedSocket> socket) {
                    auto self = weak.lock();
                    if (!self || generation != self->generation_ ||
                        self->state_.value() != ChannelState::Loading) {
                        if (socket) socket->close();
                        return;
                    }
                    if (ec) {
                        spdlog::error("Channel: socket upgrade failed: {}", ec.message());
                        retry();
                        return;
                    }
                    self->create_socket_subscription(std::move(socket));
                });
        });
}

void ChannelManager::schedule(uint64_t generation, std::function<void()> action) {
    std::weak_ptr<ChannelManager> weak = weak_from_this();
    retry_timer_.expires_after(data_.config.reconnect_interval);
    retry_timer_.async_wait([weak, generation, action = std::move(action)](const asio::error_code& ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || generation != self->generation_ ||
            self->state_.value() != ChannelState::Loading) {
            return;
        }
        action();
    });
}

void ChannelManager::on_server_request(const std::shared_ptr<IncomingRequest>& request) {
    const auto& http = request->request();

    if (data_.config.request_observer) {
        try {
            data_.config.request_observer(http);
        } catch (const std::exception& e) {
            spdlog::error("Channel: request observer failed: {}", e.what());
        }
    }

    if (ping_manager_.is_ping(http)) {
        spdlog::debug("Channel: server got ping request");
        request->respond(200, ping_manager_.pong_body(http.param("token")));
        return;
    }

    if (http.path == kSocketPath) {
        const auto type = socket_type_from_request(http);
        if (!type) {
            spdlog::warn("Channel: upgrade with unknown socket type '{}'", http.header(kSocketTypeHeader));
            request->respond(400, "unknown socket type");
            return;
        }
        if (*type == SocketType::Message) {
            if (auto socket = request->upgrade()) {
                create_socket_subscription(std::move(socket));
            }
        } else {
            file_sockets_->on_ws_request(request);
        }
        return;
    }

    request->respond(404);
    spdlog::error("Channel: got unknown request {} {}", http.method, http.target);
}

void ChannelManager::create_socket_subscription(std::shared_ptr<FramedSocket> socket) {
    spdlog::debug("Channel: starting socket subscription");

    if (connected_device_id_.empty()) {
        spdlog::warn("Channel: no connected device bound, dropping socket");
        socket->close();
        state_.set(ChannelState::NotConnected);
        return;
    }

    release_socket();
    socket_ = socket;

    auto subscription = std::make_shared<Subscription>();
    subscription->listener = data_.messages_listener;
    subscription_ = subscription;

    std::weak_ptr<ChannelManager> weak = weak_from_this();
    socket->start(
        [weak, subscription](std::string frame) {
            if (!subscription->active) return;
            if (auto self = weak.lock()) self->on_frame(subscription, frame);
        },
        [weak, subscription]() {
            if (!subscription->active) return;
            if (auto self = weak.lock()) self->on_socket_done(subscription);
        },
        [weak, subscription](const asio::error_code& ec) {
            if (!subscription->active) return;
            if (auto self = weak.lock()) self->on_socket_error(subscription, ec);
        });

    state_.set(ChannelState::Connected);
    spdlog::info("Channel: socket subscription created ({})", socket->remote_address());
    if (subscription->listener.on_created) {
        notify("created", [&]() { subscription->listener.on_created(); });
    }
}

void ChannelManager::on_frame(const std::shared_ptr<Subscription>& subscription, const std::string& frame) {
    if (frame.empty()) {
        spdlog::debug("Channel: dropped null frame");
        return;
    }

    ReceivedMessage message;
    try {
        message = codec_->decode(frame);
    } catch (const DecodeError& e) {
        spdlog::error("Channel: dropped frame: {}", e.what());
        return;
    }

    // The bound identity wins over whatever the peer reports.
    message.sender.id = connected_device_id_;

    try {
        spdlog::debug("Channel: received {} {}", content_type_name(message.content), content_id(message.content));
        handle_files_message(message.content, true, message.sender);
        if (subscription->listener.on_data) subscription->listener.on_data(message);
    } catch (const std::exception& e) {
        spdlog::error("Channel: message handler failed: {}", e.what());
    }
}

void ChannelManager::on_socket_done(const std::shared_ptr<Subscription>& subscription) {
    subscription->active = false;
    if (subscription == subscription_) {
        subscription_.reset();
        socket_.reset();
    }
    state_.set(ChannelState::NotConnected);
    spdlog::info("Channel: socket closed");
    if (subscription->listener.on_done) {
        notify("done", [&]() { subscription->listener.on_done(); });
    }
}

void ChannelManager::on_socket_error(const std::shared_ptr<Subscription>& subscription,
                                     const asio::error_code& ec) {
    spdlog::error("Channel: socket error: {}", ec.message());
    state_.set(ChannelState::NotConnected);

    if (subscription->listener.cancel_on_error) {
        subscription->active = false;
        if (subscription == subscription_) {
            release_socket();
        }
    }
    if (subscription->listener.on_error) {
        notify("error", [&]() { subscription->listener.on_error(ec); });
    }
}

void ChannelManager::handle_files_message(const MessageContent& content, bool is_received,
                                          const std::optional<DeviceInfo>& peer) {
    if (is_file_content(content)) {
        file_sockets_->handle_file_message_content(content, is_received, peer);
    }
}

void ChannelManager::release_socket() {
    if (subscription_) {
        subscription_->active = false;
        subscription_.reset();
    }
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
}
