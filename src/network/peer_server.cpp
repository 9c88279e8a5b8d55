/**
 * PeerServer — Listens on the channel port for the owner role.
 *
 * Uses standalone ASIO for async I/O.
 * Every accepted connection sends one HTTP request head; the head is parsed
 * and handed to the request callback, which answers it or upgrades it.
 */

#include "network/peer_server.h"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "network/socket_type.h"

namespace {

constexpr auto kHeadTimeout = std::chrono::seconds(5);

} // namespace

struct PeerServer::HeadReader {
    explicit HeadReader(asio::ip::tcp::socket s)
        : socket(std::move(s)), timer(socket.get_executor()) {}

    void close() {
        asio::error_code ignored;
        timer.cancel();
        socket.close(ignored);
    }

    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    std::string buffer;
};

IncomingRequest::IncomingRequest(asio::ip::tcp::socket socket, HttpRequest request, std::string buffered)
    : socket_(std::move(socket)), request_(std::move(request)), buffered_(std::move(buffered)) {
    asio::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = ep.address().to_string() + ":" + std::to_string(ep.port());
    }
}

void IncomingRequest::respond(int status, const std::string& body) {
    if (handled_) return;
    handled_ = true;

    auto self = shared_from_this();
    auto payload = std::make_shared<std::string>(make_response(status, body));
    asio::async_write(socket_, asio::buffer(*payload),
        [self, payload](const asio::error_code& ec, std::size_t) {
            if (ec) {
                spdlog::debug("PeerServer: response to {} not written: {}",
                              self->remote_address_, ec.message());
            }
            asio::error_code ignored;
            self->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            self->socket_.close(ignored);
        });
}

std::shared_ptr<FramedSocket> IncomingRequest::upgrade() {
    if (handled_) return nullptr;
    handled_ = true;

    auto socket = std::make_shared<FramedSocket>(std::move(socket_), std::move(buffered_));
    socket->send_raw(std::string("HTTP/1.1 101 Switching Protocols\r\n") +
                     "Upgrade: " + kUpgradeProtocol + "\r\n"
                     "Connection: Upgrade\r\n\r\n");
    return socket;
}

PeerServer::PeerServer(asio::io_context& io)
    : acceptor_(io) {}

void PeerServer::start(const std::string& ip, uint16_t port) {
    const auto address = ip.empty() ? asio::ip::address(asio::ip::address_v4::any())
                                    : asio::ip::make_address(ip);
    asio::ip::tcp::endpoint endpoint(address, port);

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    try {
        acceptor_.bind(endpoint);
        acceptor_.listen();
    } catch (const asio::system_error&) {
        asio::error_code ignored;
        acceptor_.close(ignored);
        throw;
    }

    spdlog::info("PeerServer: listening on {}:{}", address.to_string(), this->port());
    do_accept();
}

void PeerServer::stop() {
    for (auto& weak : readers_) {
        if (auto reader = weak.lock()) reader->close();
    }
    readers_.clear();

    if (!acceptor_.is_open()) return;
    asio::error_code ec;
    acceptor_.close(ec);
    spdlog::info("PeerServer: stopped");
}

void PeerServer::set_on_request(RequestCallback cb) {
    on_request_ = std::move(cb);
}

uint16_t PeerServer::port() const {
    asio::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void PeerServer::do_accept() {
    auto self = shared_from_this();
    acceptor_.async_accept([self](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !self->acceptor_.is_open()) {
            return;
        }
        if (ec) {
            spdlog::warn("PeerServer: accept failed: {}", ec.message());
        } else {
            self->read_head(std::move(socket));
        }
        self->do_accept();
    });
}

void PeerServer::read_head(asio::ip::tcp::socket socket) {
    auto self = shared_from_this();
    auto reader = std::make_shared<HeadReader>(std::move(socket));

    readers_.erase(std::remove_if(readers_.begin(), readers_.end(),
                                  [](const std::weak_ptr<HeadReader>& r) { return r.expired(); }),
                   readers_.end());
    readers_.push_back(reader);

    reader->timer.expires_after(kHeadTimeout);
    reader->timer.async_wait([reader](const asio::error_code& ec) {
        if (!ec) {
            asio::error_code ignored;
            reader->socket.close(ignored);
        }
    });

    asio::async_read_until(reader->socket, asio::dynamic_buffer(reader->buffer, kMaxHeadSize), "\r\n\r\n",
        [self, reader](const asio::error_code& ec, std::size_t n) {
            reader->timer.cancel();
            if (ec) {
                spdlog::debug("PeerServer: no request head: {}", ec.message());
                return;
            }
            if (!self->acceptor_.is_open()) {
                reader->close();
                return;
            }

            auto head = reader->buffer.substr(0, n);
            auto rest = reader->buffer.substr(n);
            auto parsed = HttpRequest::parse(head);

            if (!parsed) {
                spdlog::warn("PeerServer: malformed request head");
                HttpRequest empty;
                std::make_shared<IncomingRequest>(std::move(reader->socket), std::move(empty), std::string())
                    ->respond(400);
                return;
            }

            auto request = std::make_shared<IncomingRequest>(
                std::move(reader->socket), std::move(*parsed), std::move(rest));
            if (self->on_request_) {
                self->on_request_(request);
            } else {
                request->respond(404);
            }
        });
}
