/**
 * FramedSocket — length-prefixed frames over an upgraded TCP connection.
 *
 * Reads accumulate in `inbox_` and every complete frame is handed out before
 * the next read is issued. Writes are queued and flushed one at a time.
 */

#include "network/framed_socket.h"

#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kHeaderSize = 4;

uint32_t read_be32(const std::string& s) {
    return (static_cast<uint32_t>(static_cast<unsigned char>(s[0])) << 24) |
           (static_cast<uint32_t>(static_cast<unsigned char>(s[1])) << 16) |
           (static_cast<uint32_t>(static_cast<unsigned char>(s[2])) << 8) |
           static_cast<uint32_t>(static_cast<unsigned char>(s[3]));
}

std::string write_be32(uint32_t v) {
    std::string out(kHeaderSize, '\0');
    out[0] = static_cast<char>((v >> 24) & 0xff);
    out[1] = static_cast<char>((v >> 16) & 0xff);
    out[2] = static_cast<char>((v >> 8) & 0xff);
    out[3] = static_cast<char>(v & 0xff);
    return out;
}

} // namespace

FramedSocket::FramedSocket(asio::ip::tcp::socket socket, std::string buffered)
    : socket_(std::move(socket)), inbox_(std::move(buffered)) {
    asio::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = ep.address().to_string() + ":" + std::to_string(ep.port());
    }
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
}

void FramedSocket::start(FrameHandler on_frame, DoneHandler on_done, ErrorHandler on_error) {
    if (started_ || closed_) return;
    started_ = true;
    on_frame_ = std::move(on_frame);
    on_done_ = std::move(on_done);
    on_error_ = std::move(on_error);

    // Frames that arrived together with the upgrade head
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [self]() {
        self->drain_frames();
    });
}

void FramedSocket::drain_frames() {
    while (!closed_ && inbox_.size() >= kHeaderSize) {
        const uint32_t length = read_be32(inbox_);
        if (length > kMaxFrameSize) {
            spdlog::error("FramedSocket {}: frame of {} bytes exceeds limit", remote_address_, length);
            finish(asio::error::message_size);
            return;
        }
        if (inbox_.size() < kHeaderSize + length) break;

        std::string frame = inbox_.substr(kHeaderSize, length);
        inbox_.erase(0, kHeaderSize + length);
        // The handler may close this socket, which resets on_frame_.
        auto handler = on_frame_;
        if (handler) handler(std::move(frame));
    }
    if (!closed_) do_read();
}

void FramedSocket::do_read() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::dynamic_buffer(inbox_), asio::transfer_at_least(1),
        [self, this](const asio::error_code& ec, std::size_t) {
            if (closed_) return;
            if (ec) {
                finish(ec);
                return;
            }
            drain_frames();
        });
}

bool FramedSocket::send(std::string payload) {
    if (!is_open()) return false;
    if (payload.size() > kMaxFrameSize) {
        spdlog::warn("FramedSocket {}: refusing {} byte frame", remote_address_, payload.size());
        return false;
    }

    outbox_.push_back(write_be32(static_cast<uint32_t>(payload.size())) + payload);
    if (outbox_.size() == 1) {
        do_write();
    }
    return true;
}

void FramedSocket::send_raw(std::string bytes) {
    if (!is_open()) return;
    outbox_.push_back(std::move(bytes));
    if (outbox_.size() == 1) {
        do_write();
    }
}

void FramedSocket::do_write() {
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(outbox_.front()),
        [self, this](const asio::error_code& ec, std::size_t) {
            if (closed_) {
                outbox_.clear();
                return;
            }
            if (ec) {
                // The read side reports the broken connection.
                spdlog::error("FramedSocket {}: write failed: {}", remote_address_, ec.message());
                outbox_.clear();
                return;
            }
            outbox_.pop_front();
            if (!outbox_.empty()) {
                do_write();
            }
        });
}

void FramedSocket::close() {
    if (closed_) return;
    closed_ = true;

    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);

    on_frame_ = nullptr;
    on_done_ = nullptr;
    on_error_ = nullptr;
}

void FramedSocket::finish(const asio::error_code& ec) {
    auto on_done = std::move(on_done_);
    auto on_error = std::move(on_error_);
    close();

    if (ec && ec != asio::error::eof) {
        spdlog::debug("FramedSocket {}: read ended: {}", remote_address_, ec.message());
        if (on_error) on_error(ec);
    }
    if (on_done) on_done();
}
