/**
 * nearlink — Channel Entry Point
 *
 * Loads config, initialises libsodium, brings the channel up in the role
 * the configured group assigns, then sends every stdin line to the peer as
 * a text message and logs whatever comes back.
 */

#include <csignal>
#include <functional>
#include <memory>
#include <string>

#include <unistd.h>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "channel/channel_manager.h"
#include "config/app_config.h"
#include "crypto/crypto_manager.h"
#include "group/static_group_info.h"

namespace {

MessagesListener make_messages_listener(const std::shared_ptr<ChannelManager>& channel,
                                        const AppConfig& config) {
    std::weak_ptr<ChannelManager> weak = channel;

    MessagesListener listener;
    listener.on_created = [&config]() {
        spdlog::info("Channel ready, talking to {}", config.peer_id);
    };
    listener.on_data = [weak, &config](const ReceivedMessage& message) {
        std::visit(overloaded{
            [&](const TextRequest& text) {
                spdlog::info("[{}] {}", message.sender.id, text.value);
                if (auto channel = weak.lock()) {
                    channel->send(OutgoingMessage{TextResponse{text.id}, DeviceInfo{config.peer_id, {}}});
                }
            },
            [&](const TextResponse& ack) {
                spdlog::debug("Delivered {}", ack.id);
            },
            [&](const FilesRequest& offer) {
                spdlog::info("{} offers {} files, declining", message.sender.id, offer.files.size());
                if (auto channel = weak.lock()) {
                    channel->send(OutgoingMessage{FilesResponse{offer.id, false}, DeviceInfo{config.peer_id, {}}});
                }
            },
            [&](const FilesResponse& answer) {
                spdlog::info("Transfer {} {}", answer.id, answer.is_accepted ? "accepted" : "declined");
            },
        }, message.content);
    };
    listener.on_done = []() {
        spdlog::warn("Channel closed by peer");
    };
    listener.on_error = [](const asio::error_code& ec) {
        spdlog::error("Channel error: {}", ec.message());
    };
    return listener;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    const std::string config_path = (argc > 1) ? argv[1] : "config.json";
    AppConfig config;
    try {
        config = load_config(config_path);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("nearlink starting as {} ({})", config.device.id,
                 config.group.is_group_owner ? "group owner" : "client");

    if (!CryptoManager::init()) {
        spdlog::error("libsodium initialisation failed");
        return 1;
    }

    asio::io_context io;
    StaticGroupInfo group(config.group, config.device);
    auto channel = std::make_shared<ChannelManager>(io, group);

    ChannelData data;
    data.connected_device_id = config.peer_id;
    data.config = config.channel;
    data.messages_listener = make_messages_listener(channel, config);

    try {
        channel->start_socket(std::move(data));
    } catch (const asio::system_error& e) {
        spdlog::error("Cannot start channel: {}", e.what());
        return 1;
    }

    asio::posix::stream_descriptor input(io, ::dup(STDIN_FILENO));
    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const asio::error_code& ec, int) {
        if (ec) return;
        spdlog::info("Shutting down");
        channel->cancel();
        asio::error_code ignored;
        input.close(ignored);
        io.stop();
    });

    // stdin lines become text messages, read on the same io_context.
    std::string pending;
    std::function<void()> read_line = [&]() {
        asio::async_read_until(input, asio::dynamic_buffer(pending), '\n',
            [&](const asio::error_code& ec, std::size_t n) {
                if (ec) {
                    if (ec != asio::error::operation_aborted) spdlog::info("stdin closed");
                    return;
                }
                std::string line = pending.substr(0, n - 1);
                pending.erase(0, n);
                if (!line.empty()) {
                    OutgoingMessage message{TextRequest::create(line), DeviceInfo{config.peer_id, {}}};
                    if (!channel->send(message)) {
                        spdlog::warn("Not sent, channel is {}", to_string(channel->state_value()));
                    }
                }
                read_line();
            });
    };
    read_line();

    io.run();
    return 0;
}
