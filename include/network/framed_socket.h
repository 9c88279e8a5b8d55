#pragma once

#include <asio.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

/**
 * Persistent duplex socket left behind by an upgrade.
 *
 * Each frame is a 4-byte big-endian length followed by the payload.
 * A zero-length frame is delivered as an empty string.
 */
class FramedSocket : public std::enable_shared_from_this<FramedSocket> {
public:
    using FrameHandler = std::function<void(std::string frame)>;
    using DoneHandler  = std::function<void()>;
    using ErrorHandler = std::function<void(const asio::error_code& ec)>;

    static constexpr uint32_t kMaxFrameSize = 16u * 1024u * 1024u;

    /// `buffered` holds bytes already read past the upgrade head.
    FramedSocket(asio::ip::tcp::socket socket, std::string buffered = {});

    /// Begin reading. Frames arrive in order; after a read error `on_error`
    /// runs before `on_done`.
    void start(FrameHandler on_frame, DoneHandler on_done, ErrorHandler on_error);

    /// Queue one frame. False if the socket is closed or the payload is too big.
    bool send(std::string payload);

    /// Queue unframed bytes, used for the upgrade answer.
    void send_raw(std::string bytes);

    /// Close locally. No handler runs after this.
    void close();

    [[nodiscard]] bool is_open() const { return !closed_ && socket_.is_open(); }
    [[nodiscard]] const std::string& remote_address() const { return remote_address_; }

private:
    void do_read();
    void drain_frames();
    void do_write();
    void finish(const asio::error_code& ec);

    asio::ip::tcp::socket socket_;
    std::string remote_address_;
    std::string inbox_;
    std::deque<std::string> outbox_;
    FrameHandler on_frame_;
    DoneHandler on_done_;
    ErrorHandler on_error_;
    bool started_ = false;
    bool closed_ = false;
};
