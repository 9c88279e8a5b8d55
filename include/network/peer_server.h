#pragma once

#include <asio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "network/framed_socket.h"
#include "network/http_message.h"

/**
 * One parsed request on the listening port, waiting for a verdict.
 *
 * Exactly one of respond() or upgrade() takes effect; dropping the object
 * without either closes the connection.
 */
class IncomingRequest : public std::enable_shared_from_this<IncomingRequest> {
public:
    IncomingRequest(asio::ip::tcp::socket socket, HttpRequest request, std::string buffered);

    [[nodiscard]] const HttpRequest& request() const { return request_; }
    [[nodiscard]] const std::string& remote_address() const { return remote_address_; }

    /// Write a complete response and close the connection.
    void respond(int status, const std::string& body = {});

    /// Answer 101 and hand the connection over as a FramedSocket.
    /// Returns nullptr if the request was already handled.
    std::shared_ptr<FramedSocket> upgrade();

private:
    asio::ip::tcp::socket socket_;
    HttpRequest request_;
    std::string buffered_;
    std::string remote_address_;
    bool handled_ = false;
};

/**
 * Listening side of the channel. Reads one request head per accepted
 * connection and passes it on.
 */
class PeerServer : public std::enable_shared_from_this<PeerServer> {
public:
    using RequestCallback = std::function<void(std::shared_ptr<IncomingRequest> request)>;

    static constexpr std::size_t kMaxHeadSize = 8 * 1024;

    explicit PeerServer(asio::io_context& io);

    /// Bind and listen. Throws asio::system_error if the port is unavailable.
    void start(const std::string& ip, uint16_t port);

    /// Close the acceptor and every connection still sending its head.
    /// Nothing reaches the request callback afterwards.
    void stop();

    void set_on_request(RequestCallback cb);

    [[nodiscard]] bool is_listening() const { return acceptor_.is_open(); }
    [[nodiscard]] uint16_t port() const;

private:
    struct HeadReader;

    void do_accept();
    void read_head(asio::ip::tcp::socket socket);

    asio::ip::tcp::acceptor acceptor_;
    RequestCallback on_request_;
    std::vector<std::weak_ptr<HeadReader>> readers_;
};
