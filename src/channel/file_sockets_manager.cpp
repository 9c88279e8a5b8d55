/**
 * FileSocketsManager — lifecycle of the per-transfer file sockets.
 *
 * A session is created when a FilesRequest is sent or received, gets a
 * socket once the offer is accepted, and is destroyed when that socket
 * closes or the channel is cancelled. Ids of destroyed sessions stay
 * retired until close_all() so a transfer id is never reused.
 */

#include "channel/file_sockets_manager.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>
#include <vector>

#include "network/socket_type.h"

namespace {

template <class Fn>
void notify(const char* what, const std::string& transfer_id, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        spdlog::error("FileSockets: {} listener failed for {}: {}", what, transfer_id, e.what());
    }
}

} // namespace

FileSocketsManager::FileSocketsManager(PeerClient& client, GroupInfoProvider& group)
    : client_(client), group_(group) {}

FileSocketsManager::~FileSocketsManager() {
    listener_ = FilesListener{};
    close_all();
}

void FileSocketsManager::set_listener(FilesListener listener) {
    listener_ = std::move(listener);
}

void FileSocketsManager::set_connection_data(const ChannelConfig& config) {
    config_ = config;
}

void FileSocketsManager::on_ws_request(const std::shared_ptr<IncomingRequest>& request) {
    const auto transfer_id = request->request().header(kTransferIdHeader);
    if (transfer_id.empty()) {
        spdlog::warn("FileSockets: upgrade from {} without transfer id", request->remote_address());
        request->respond(400, "missing transfer id");
        return;
    }

    auto it = sessions_.find(transfer_id);
    if (it != sessions_.end() && it->second.socket) {
        spdlog::warn("FileSockets: transfer {} already has a socket", transfer_id);
        request->respond(409, "transfer already connected");
        return;
    }
    if (it == sessions_.end()) {
        if (retired_.count(transfer_id)) {
            spdlog::warn("FileSockets: transfer id {} was already used", transfer_id);
            request->respond(409, "transfer id retired");
            return;
        }
        Entry entry;
        entry.session.transfer_id = transfer_id;
        entry.session.direction = TransferDirection::Response;
        entry.session.peer_id = request->request().header(kSenderIdHeader);
        entry.session.status = TransferStatus::AwaitingSocket;
        sessions_.emplace(transfer_id, std::move(entry));
    }

    auto socket = request->upgrade();
    if (!socket) return;
    attach(transfer_id, std::move(socket));
}

void FileSocketsManager::handle_file_message_content(const MessageContent& content, bool is_received,
                                                     const std::optional<DeviceInfo>& peer) {
    std::visit(overloaded{
        [&](const FilesRequest& request)   { on_files_request(request, is_received, peer); },
        [&](const FilesResponse& response) { on_files_response(response, is_received, peer); },
        [](const TextRequest&)  {},
        [](const TextResponse&) {},
    }, content);
}

void FileSocketsManager::on_files_request(const FilesRequest& request, bool is_received,
                                          const std::optional<DeviceInfo>& peer) {
    if (sessions_.count(request.id) || retired_.count(request.id)) {
        spdlog::warn("FileSockets: ignoring files request with duplicate id {}", request.id);
        return;
    }

    Entry entry;
    entry.session.transfer_id = request.id;
    entry.session.direction = is_received ? TransferDirection::Response : TransferDirection::Request;
    entry.session.peer_id = peer ? peer->id : std::string();
    entry.session.status = TransferStatus::Pending;
    sessions_.emplace(request.id, std::move(entry));

    spdlog::debug("FileSockets: pending transfer {} ({} files)", request.id, request.files.size());
}

void FileSocketsManager::on_files_response(const FilesResponse& response, bool is_received,
                                           const std::optional<DeviceInfo>& peer) {
    auto it = sessions_.find(response.id);

    if (!response.is_accepted) {
        if (it != sessions_.end() && !it->second.socket) {
            sessions_.erase(it);
            retired_.insert(response.id);
        }
        spdlog::info("FileSockets: transfer {} declined", response.id);
        return;
    }

    if (it == sessions_.end()) {
        if (retired_.count(response.id)) {
            spdlog::warn("FileSockets: response for retired transfer {}", response.id);
            return;
        }
        // An answer to an offer we did not see; whoever receives the answer made the offer.
        Entry entry;
        entry.session.transfer_id = response.id;
        entry.session.direction = is_received ? TransferDirection::Request : TransferDirection::Response;
        entry.session.peer_id = peer ? peer->id : std::string();
        it = sessions_.emplace(response.id, std::move(entry)).first;
    }

    if (it->second.socket) return;
    it->second.session.status = TransferStatus::AwaitingSocket;

    auto info = group_.connection_info();
    if (!info || !info->group_formed) {
        spdlog::warn("FileSockets: no group for transfer {}", response.id);
        return;
    }
    if (!info->is_group_owner) {
        connect_outbound(response.id, info->owner_address);
    }
}

void FileSocketsManager::connect_outbound(const std::string& transfer_id, const std::string& owner_address) {
    std::map<std::string, std::string> headers{{kTransferIdHeader, transfer_id}};
    if (auto me = group_.current_device()) {
        headers[kSenderIdHeader] = me->id;
    }

    std::weak_ptr<FileSocketsManager> weak = weak_from_this();
    const auto generation = generation_;

    client_.connect_to_socket(owner_address, config_.port, SocketType::File, headers, config_.probe_timeout,
        [weak, generation, transfer_id](const asio::error_code& ec, std::shared_ptr<FramedSocket> socket) {
            auto self = weak.lock();
            if (!self || self->generation_ != generation || !self->sessions_.count(transfer_id)) {
                if (socket) socket->close();
                return;
            }
            if (ec) {
                spdlog::error("FileSockets: transfer {} could not connect: {}", transfer_id, ec.message());
                auto on_error = self->listener_.on_error;
                self->sessions_.erase(transfer_id);
                self->retired_.insert(transfer_id);
                if (on_error) notify("error", transfer_id, [&]() { on_error(transfer_id, ec); });
                return;
            }
            self->attach(transfer_id, std::move(socket));
        });
}

void FileSocketsManager::attach(const std::string& transfer_id, std::shared_ptr<FramedSocket> socket) {
    auto& entry = sessions_[transfer_id];
    entry.socket = socket;
    entry.session.transfer_id = transfer_id;
    entry.session.status = TransferStatus::Open;
    const auto session = entry.session;

    std::weak_ptr<FileSocketsManager> weak = weak_from_this();
    const auto generation = generation_;
    auto current = [weak, generation]() -> std::shared_ptr<FileSocketsManager> {
        auto self = weak.lock();
        return self && self->generation_ == generation ? self : nullptr;
    };

    socket->start(
        [current, transfer_id](std::string chunk) {
            if (auto self = current()) {
                if (self->listener_.on_data) {
                    notify("data", transfer_id, [&]() { self->listener_.on_data(transfer_id, chunk); });
                }
            }
        },
        [current, transfer_id]() {
            if (auto self = current()) {
                self->remove(transfer_id);
            }
        },
        [current, transfer_id](const asio::error_code& ec) {
            if (auto self = current()) {
                spdlog::error("FileSockets: transfer {} socket error: {}", transfer_id, ec.message());
                if (self->listener_.on_error) {
                    notify("error", transfer_id, [&]() { self->listener_.on_error(transfer_id, ec); });
                }
            }
        });

    spdlog::info("FileSockets: transfer {} connected ({})", transfer_id, socket->remote_address());
    if (listener_.on_created) {
        notify("created", transfer_id, [&]() { listener_.on_created(session); });
    }
}

void FileSocketsManager::remove(const std::string& transfer_id) {
    if (sessions_.erase(transfer_id) == 0) return;
    retired_.insert(transfer_id);
    spdlog::debug("FileSockets: transfer {} closed", transfer_id);
    if (listener_.on_closed) {
        notify("close", transfer_id, [&]() { listener_.on_closed(transfer_id); });
    }
}

bool FileSocketsManager::send(const std::string& transfer_id, std::string chunk) {
    auto it = sessions_.find(transfer_id);
    if (it == sessions_.end() || !it->second.socket) return false;
    return it->second.socket->send(std::move(chunk));
}

void FileSocketsManager::close_all() noexcept {
    ++generation_;
    auto sessions = std::move(sessions_);
    sessions_.clear();
    retired_.clear();

    std::vector<std::string> closed;
    for (auto& [transfer_id, entry] : sessions) {
        if (entry.socket) {
            entry.socket->close();
            closed.push_back(transfer_id);
        }
    }
    if (!closed.empty()) {
        spdlog::info("FileSockets: closed {} file sockets", closed.size());
    }

    for (const auto& transfer_id : closed) {
        if (listener_.on_closed) {
            notify("close", transfer_id, [&]() { listener_.on_closed(transfer_id); });
        }
    }
}

std::optional<FileTransferSession> FileSocketsManager::session(const std::string& transfer_id) const {
    auto it = sessions_.find(transfer_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second.session;
}

std::size_t FileSocketsManager::open_socket_count() const {
    std::size_t count = 0;
    for (const auto& entry : sessions_) {
        if (entry.second.socket && entry.second.socket->is_open()) ++count;
    }
    return count;
}
