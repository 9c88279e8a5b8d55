/**
 * PeerClient — Reaches the group owner's channel port.
 *
 * Opens a TCP connection per call: either a probe that reads a plain
 * response to EOF, or an upgrade that keeps the connection as a
 * FramedSocket once the owner answers 101.
 */

#include "network/peer_client.h"

#include <spdlog/spdlog.h>

#include <sstream>
#include <system_error>

namespace {

/// State shared by the async steps of one outbound exchange.
struct Exchange {
    explicit Exchange(asio::io_context& io) : socket(io), timer(io) {}

    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    std::string request;
    std::string buffer;
    bool timed_out = false;
    bool finished = false;
};

using ConnectedHandler = std::function<void(const asio::error_code&)>;

// Connect with a deadline; on expiry the socket is closed and the pending
// operation fails with operation_aborted, reported as timed_out.
void connect_with_deadline(const std::shared_ptr<Exchange>& ex,
                           const std::string& address, uint16_t port,
                           std::chrono::milliseconds timeout,
                           ConnectedHandler on_connected) {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        asio::post(ex->socket.get_executor(), [on_connected, ec]() { on_connected(ec); });
        return;
    }

    ex->timer.expires_after(timeout);
    ex->timer.async_wait([ex](const asio::error_code& ec) {
        if (!ec) {
            ex->timed_out = true;
            asio::error_code ignored;
            ex->socket.close(ignored);
        }
    });

    ex->socket.async_connect(asio::ip::tcp::endpoint(ip, port),
        [ex, on_connected = std::move(on_connected)](const asio::error_code& ec) {
            if (ex->timed_out) {
                on_connected(asio::error_code(asio::error::timed_out));
                return;
            }
            on_connected(ec);
        });
}

std::string build_upgrade_request(const std::string& ip, uint16_t port, SocketType type,
                                  const std::map<std::string, std::string>& headers) {
    std::ostringstream out;
    out << "GET " << kSocketPath << " HTTP/1.1\r\n"
        << "Host: " << ip << ':' << port << "\r\n"
        << "Connection: Upgrade\r\n"
        << "Upgrade: " << kUpgradeProtocol << "\r\n"
        << kSocketTypeHeader << ": " << socket_type_name(type) << "\r\n";
    for (const auto& [name, value] : headers) {
        out << name << ": " << value << "\r\n";
    }
    out << "\r\n";
    return out.str();
}

} // namespace

PeerClient::PeerClient(asio::io_context& io) : io_(io) {}

void PeerClient::ping_server(const std::string& address, uint16_t port,
                             const std::string& ping_request,
                             std::chrono::milliseconds timeout,
                             PingCallback cb) {
    auto ex = std::make_shared<Exchange>(io_);
    ex->request = ping_request;

    auto complete = [ex, cb](std::optional<HttpResponse> response) {
        if (ex->finished) return;
        ex->finished = true;
        ex->timer.cancel();
        asio::error_code ignored;
        ex->socket.close(ignored);
        cb(std::move(response));
    };

    connect_with_deadline(ex, address, port, timeout, [ex, complete, address, port](const asio::error_code& ec) {
        if (ec) {
            spdlog::debug("PeerClient: ping {}:{} failed to connect: {}", address, port, ec.message());
            complete(std::nullopt);
            return;
        }

        asio::async_write(ex->socket, asio::buffer(ex->request),
            [ex, complete](const asio::error_code& ec, std::size_t) {
                if (ec) {
                    complete(std::nullopt);
                    return;
                }
                asio::async_read(ex->socket, asio::dynamic_buffer(ex->buffer),
                    [ex, complete](const asio::error_code& ec, std::size_t) {
                        if (ec && ec != asio::error::eof) {
                            complete(std::nullopt);
                            return;
                        }
                        complete(HttpResponse::parse(ex->buffer));
                    });
            });
    });
}

void PeerClient::connect_to_socket(const std::string& ip, uint16_t port, SocketType type,
                                   const std::map<std::string, std::string>& headers,
                                   std::chrono::milliseconds timeout,
                                   ConnectCallback cb) {
    auto ex = std::make_shared<Exchange>(io_);
    ex->request = build_upgrade_request(ip, port, type, headers);

    auto fail = [ex, cb](const asio::error_code& ec) {
        if (ex->finished) return;
        ex->finished = true;
        ex->timer.cancel();
        asio::error_code ignored;
        ex->socket.close(ignored);
        const asio::error_code reported =
            ex->timed_out ? asio::error_code(asio::error::timed_out) : ec;
        cb(reported, nullptr);
    };

    connect_with_deadline(ex, ip, port, timeout, [ex, fail, cb, type](const asio::error_code& ec) {
        if (ec) {
            fail(ec);
            return;
        }

        asio::async_write(ex->socket, asio::buffer(ex->request),
            [ex, fail, cb, type](const asio::error_code& ec, std::size_t) {
                if (ec) {
                    fail(ec);
                    return;
                }
                asio::async_read_until(ex->socket, asio::dynamic_buffer(ex->buffer), "\r\n\r\n",
                    [ex, fail, cb, type](const asio::error_code& ec, std::size_t n) {
                        if (ec) {
                            fail(ec);
                            return;
                        }

                        auto response = HttpResponse::parse(ex->buffer.substr(0, n));
                        if (!response || response->status != 101 ||
                            response->header("Upgrade") != kUpgradeProtocol) {
                            spdlog::warn("PeerClient: {} upgrade rejected (status {})",
                                         socket_type_name(type), response ? response->status : 0);
                            fail(std::make_error_code(std::errc::connection_refused));
                            return;
                        }

                        ex->finished = true;
                        ex->timer.cancel();
                        auto socket = std::make_shared<FramedSocket>(std::move(ex->socket),
                                                                     ex->buffer.substr(n));
                        cb(asio::error_code(), std::move(socket));
                    });
            });
    });
}
