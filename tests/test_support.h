#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace test_support {

/// Ask the kernel for a free loopback port.
inline uint16_t free_port() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

/// Run `io` until `pred` holds or `timeout` elapses. Returns pred().
inline bool run_until(asio::io_context& io, const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred() && std::chrono::steady_clock::now() < deadline) {
        io.restart();
        io.run_for(std::chrono::milliseconds(10));
    }
    return pred();
}

/// Keep the loop turning for `duration` regardless of state.
inline void run_for(asio::io_context& io, std::chrono::milliseconds duration) {
    run_until(io, [] { return false; }, duration);
}

/**
 * Hand-written peer on the test loop: connects, writes `request` and
 * collects everything the server sends back until EOF.
 */
struct RawExchange : std::enable_shared_from_this<RawExchange> {
    explicit RawExchange(asio::io_context& io) : socket(io) {}

    void start(uint16_t port, std::string request) {
        outgoing = std::move(request);
        auto self = shared_from_this();
        socket.async_connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port),
            [self](const asio::error_code& ec) {
                if (ec) {
                    self->done = true;
                    return;
                }
                asio::async_write(self->socket, asio::buffer(self->outgoing),
                    [self](const asio::error_code& ec, std::size_t) {
                        if (ec) {
                            self->done = true;
                            return;
                        }
                        self->read();
                    });
            });
    }

    void read() {
        auto self = shared_from_this();
        asio::async_read(socket, asio::dynamic_buffer(response), asio::transfer_at_least(1),
            [self](const asio::error_code& ec, std::size_t) {
                if (ec) {
                    self->done = true;
                    return;
                }
                self->read();
            });
    }

    void write(const std::string& bytes) {
        auto self = shared_from_this();
        auto data = std::make_shared<std::string>(bytes);
        asio::async_write(socket, asio::buffer(*data), [self, data](const asio::error_code&, std::size_t) {});
    }

    asio::ip::tcp::socket socket;
    std::string outgoing;
    std::string response;
    bool done = false;
};

inline std::shared_ptr<RawExchange> raw_exchange(asio::io_context& io, uint16_t port,
                                                 const std::string& request) {
    auto ex = std::make_shared<RawExchange>(io);
    ex->start(port, request);
    return ex;
}

/// 4-byte big-endian length prefix followed by the payload.
inline std::string frame(const std::string& payload) {
    const auto n = static_cast<uint32_t>(payload.size());
    std::string out;
    out += static_cast<char>((n >> 24) & 0xff);
    out += static_cast<char>((n >> 16) & 0xff);
    out += static_cast<char>((n >> 8) & 0xff);
    out += static_cast<char>(n & 0xff);
    return out + payload;
}

} // namespace test_support
