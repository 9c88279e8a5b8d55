#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "channel/channel_manager.h"
#include "crypto/crypto_manager.h"
#include "group/static_group_info.h"
#include "protocol/message_codec.h"
#include "test_support.h"

using namespace std::chrono_literals;

namespace {

/// Everything a MessagesListener reported, in order.
struct Recorder {
    std::vector<ReceivedMessage> messages;
    int created = 0;
    int done = 0;
    std::vector<asio::error_code> errors;
    std::vector<std::string> order;

    MessagesListener listener(bool cancel_on_error = false) {
        MessagesListener l;
        l.on_data = [this](const ReceivedMessage& m) { messages.push_back(m); order.push_back("data"); };
        l.on_created = [this]() { ++created; order.push_back("created"); };
        l.on_done = [this]() { ++done; order.push_back("done"); };
        l.on_error = [this](const asio::error_code& ec) { errors.push_back(ec); order.push_back("error"); };
        l.cancel_on_error = cancel_on_error;
        return l;
    }

    int events() const {
        return static_cast<int>(messages.size()) + created + done + static_cast<int>(errors.size());
    }
};

} // namespace

class ChannelManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoManager::init());
        port = test_support::free_port();

        owner = std::make_shared<ChannelManager>(io, owner_group);
        client = std::make_shared<ChannelManager>(io, client_group);

        owner->state().subscribe([this](ChannelState s) { owner_states.push_back(s); });
        client->state().subscribe([this](ChannelState s) { client_states.push_back(s); });
    }

    void TearDown() override {
        client->cancel();
        owner->cancel();
        test_support::run_for(io, 20ms);
    }

    ChannelData data_for(const std::string& peer_id, Recorder& recorder, bool cancel_on_error = false) {
        ChannelData data;
        data.connected_device_id = peer_id;
        data.config.port = port;
        data.config.reconnect_interval = 100ms;
        data.config.probe_timeout = 500ms;
        data.messages_listener = recorder.listener(cancel_on_error);
        return data;
    }

    bool connect_both() {
        owner->start_socket(data_for("client", owner_events));
        client->start_socket(data_for("owner", client_events));
        return test_support::run_until(io, [&] {
            return owner->state_value() == ChannelState::Connected &&
                   client->state_value() == ChannelState::Connected;
        });
    }

    asio::io_context io;
    uint16_t port = 0;

    StaticGroupInfo owner_group{ConnectionInfo{true, true, "127.0.0.1"}, DeviceInfo{"owner", "Owner"}};
    StaticGroupInfo client_group{ConnectionInfo{true, false, "127.0.0.1"}, DeviceInfo{"client", "Client"}};

    std::shared_ptr<ChannelManager> owner;
    std::shared_ptr<ChannelManager> client;
    std::vector<ChannelState> owner_states;
    std::vector<ChannelState> client_states;
    Recorder owner_events;
    Recorder client_events;
};

TEST_F(ChannelManagerTest, ClientReachesConnectedThroughLoading) {
    EXPECT_EQ(client->state_value(), ChannelState::NotConnected);
    ASSERT_TRUE(connect_both());

    ASSERT_GE(client_states.size(), 2u);
    EXPECT_EQ(client_states.front(), ChannelState::Loading);
    EXPECT_EQ(client_states.back(), ChannelState::Connected);
    for (std::size_t i = 0; i + 1 < client_states.size(); ++i) {
        EXPECT_EQ(client_states[i], ChannelState::Loading);
    }

    EXPECT_EQ(owner_events.created, 1);
    EXPECT_EQ(client_events.created, 1);
    EXPECT_GT(owner->listening_port(), 0);
    EXPECT_EQ(client->listening_port(), 0);
}

TEST_F(ChannelManagerTest, MessagesFlowBothWays) {
    ASSERT_TRUE(connect_both());

    auto hello = TextRequest::create("hello owner");
    EXPECT_TRUE(client->send(OutgoingMessage{hello, DeviceInfo{"owner", ""}}));
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner_events.messages.size() == 1; }));

    const auto& received = owner_events.messages[0];
    EXPECT_EQ(received.content, MessageContent{hello});
    EXPECT_EQ(received.sender.id, "client");
    EXPECT_EQ(received.sender.display_name, "Client");

    EXPECT_TRUE(owner->send(OutgoingMessage{TextResponse{hello.id}, DeviceInfo{"client", ""}}));
    ASSERT_TRUE(test_support::run_until(io, [&] { return client_events.messages.size() == 1; }));
    EXPECT_EQ(client_events.messages[0].content, MessageContent{TextResponse{hello.id}});
    EXPECT_EQ(client_events.messages[0].sender.id, "owner");
}

TEST_F(ChannelManagerTest, FramesArriveInOrder) {
    ASSERT_TRUE(connect_both());

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(client->send(OutgoingMessage{TextRequest{std::to_string(i), "n"}, DeviceInfo{"owner", ""}}));
    }
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner_events.messages.size() == 20; }));
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(content_id(owner_events.messages[i].content), std::to_string(i));
    }
}

TEST_F(ChannelManagerTest, SenderIdentityIsCoercedToBoundPeer) {
    owner->start_socket(data_for("bound-client", owner_events));
    client->start_socket(data_for("owner", client_events));
    ASSERT_TRUE(test_support::run_until(io, [&] {
        return client->state_value() == ChannelState::Connected &&
               owner->state_value() == ChannelState::Connected;
    }));

    EXPECT_TRUE(client->send(OutgoingMessage{TextRequest::create("hi"), DeviceInfo{"owner", ""}}));
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner_events.messages.size() == 1; }));
    EXPECT_EQ(owner_events.messages[0].sender.id, "bound-client");
}

TEST_F(ChannelManagerTest, WrongReceiverIsNotSent) {
    ASSERT_TRUE(connect_both());

    EXPECT_FALSE(client->send(OutgoingMessage{TextRequest::create("hi"), DeviceInfo{"stranger", ""}}));
    test_support::run_for(io, 100ms);
    EXPECT_TRUE(owner_events.messages.empty());
}

TEST_F(ChannelManagerTest, SendWithoutSocketReturnsFalse) {
    EXPECT_FALSE(client->send(OutgoingMessage{TextRequest::create("hi"), DeviceInfo{"owner", ""}}));
}

TEST_F(ChannelManagerTest, InvalidMessageThrowsWithoutStateChange) {
    ASSERT_TRUE(connect_both());
    const auto before = client_states.size();

    EXPECT_THROW(client->send(OutgoingMessage{TextRequest{"id", ""}, DeviceInfo{"owner", ""}}),
                 InvalidMessageError);
    EXPECT_THROW(client->send(OutgoingMessage{TextRequest::create("hi"), DeviceInfo{}}),
                 InvalidMessageError);

    EXPECT_EQ(client_states.size(), before);
    EXPECT_EQ(client->state_value(), ChannelState::Connected);
}

TEST_F(ChannelManagerTest, CancelStopsEverything) {
    ASSERT_TRUE(connect_both());
    const auto client_events_before = client_events.events();

    EXPECT_TRUE(client->cancel());
    EXPECT_EQ(client->state_value(), ChannelState::NotConnected);
    EXPECT_TRUE(client->connected_device_id().empty());

    // The owner sees the peer go away.
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner_events.done == 1; }));
    EXPECT_EQ(owner->state_value(), ChannelState::NotConnected);

    EXPECT_FALSE(owner->send(OutgoingMessage{TextRequest::create("late"), DeviceInfo{"client", ""}}));
    test_support::run_for(io, 100ms);
    EXPECT_EQ(client_events.events(), client_events_before);

    EXPECT_TRUE(client->cancel());
    EXPECT_EQ(client->state_value(), ChannelState::NotConnected);
}

TEST_F(ChannelManagerTest, CancelStopsRetryLoop) {
    // No owner yet: the client keeps probing.
    client->start_socket(data_for("owner", client_events));
    test_support::run_for(io, 250ms);
    EXPECT_EQ(client->state_value(), ChannelState::Loading);

    EXPECT_TRUE(client->cancel());
    const auto probes = client_group.queries();
    const auto states = client_states.size();

    owner->start_socket(data_for("client", owner_events));
    test_support::run_for(io, 400ms);

    EXPECT_EQ(client->state_value(), ChannelState::NotConnected);
    EXPECT_EQ(client_group.queries(), probes);
    EXPECT_EQ(client_states.size(), states);
    EXPECT_EQ(owner_events.created, 0);
}

TEST_F(ChannelManagerTest, ClientRetriesUntilOwnerListens) {
    client->start_socket(data_for("owner", client_events));
    test_support::run_for(io, 350ms);

    EXPECT_EQ(client->state_value(), ChannelState::Loading);
    EXPECT_GE(client_states.size(), 3u);
    for (auto s : client_states) {
        EXPECT_EQ(s, ChannelState::Loading);
    }

    const auto owner_ready = std::chrono::steady_clock::now();
    owner->start_socket(data_for("client", owner_events));
    ASSERT_TRUE(test_support::run_until(io, [&] {
        return client->state_value() == ChannelState::Connected &&
               owner->state_value() == ChannelState::Connected;
    }));
    EXPECT_EQ(client_events.created, 1);

    // One pending retry delay plus one ping round trip at most.
    const auto elapsed = std::chrono::steady_clock::now() - owner_ready;
    EXPECT_LT(elapsed, 100ms + 500ms);
}

TEST_F(ChannelManagerTest, NoGroupSchedulesRetry) {
    StaticGroupInfo pending;
    auto waiting = std::make_shared<ChannelManager>(io, pending);
    Recorder events;

    EXPECT_FALSE(waiting->start_socket(data_for("owner", events)));
    EXPECT_EQ(waiting->state_value(), ChannelState::Loading);

    test_support::run_for(io, 250ms);
    EXPECT_EQ(waiting->state_value(), ChannelState::Loading);
    EXPECT_GE(pending.queries(), 2);

    // Group shows up; the next retry takes the client path.
    owner->start_socket(data_for("client", owner_events));
    pending.set_current_device(DeviceInfo{"client", "Client"});
    pending.set_connection_info(ConnectionInfo{true, false, "127.0.0.1"});
    ASSERT_TRUE(test_support::run_until(io, [&] {
        return waiting->state_value() == ChannelState::Connected;
    }));

    waiting->cancel();
}

TEST_F(ChannelManagerTest, BindFailurePropagates) {
    asio::ip::tcp::acceptor blocker(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));

    Recorder events;
    EXPECT_THROW(owner->start_socket(data_for("client", events)), asio::system_error);
    EXPECT_EQ(owner->state_value(), ChannelState::NotConnected);
    EXPECT_EQ(owner->listening_port(), 0);
}

TEST_F(ChannelManagerTest, PingIsAnsweredAndNeverRouted) {
    std::vector<std::string> seen;
    auto data = data_for("client", owner_events);
    data.config.request_observer = [&](const HttpRequest& r) { seen.push_back(r.path); };
    owner->start_socket(std::move(data));

    PingManager pings;
    const auto token = pings.build_ping();
    auto ex = test_support::raw_exchange(io, port, pings.build_ping_request(token, "127.0.0.1", port));
    ASSERT_TRUE(test_support::run_until(io, [&] { return ex->done; }));

    EXPECT_TRUE(pings.is_pong(HttpResponse::parse(ex->response), token));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "/ping");
    EXPECT_EQ(owner->state_value(), ChannelState::Loading);
    EXPECT_EQ(owner_events.created, 0);
    EXPECT_EQ(owner->file_sockets().session_count(), 0u);
}

TEST_F(ChannelManagerTest, UnknownPathAndTypeAreRejected) {
    std::vector<std::string> seen;
    auto data = data_for("client", owner_events);
    data.config.request_observer = [&](const HttpRequest& r) { seen.push_back(r.path); };
    owner->start_socket(std::move(data));

    auto unknown = test_support::raw_exchange(io, port, "GET /whatever HTTP/1.1\r\n\r\n");
    auto bad_type = test_support::raw_exchange(io, port,
        "GET /ws HTTP/1.1\r\nUpgrade: nearlink-frames/1\r\nX-Socket-Type: video\r\n\r\n");
    auto bad_ping = test_support::raw_exchange(io, port, "GET /ping?token=nope HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(test_support::run_until(io, [&] { return unknown->done && bad_type->done && bad_ping->done; }));

    EXPECT_EQ(unknown->response.rfind("HTTP/1.1 404", 0), 0u);
    EXPECT_EQ(bad_type->response.rfind("HTTP/1.1 400", 0), 0u);
    EXPECT_EQ(bad_ping->response.rfind("HTTP/1.1 404", 0), 0u);
    EXPECT_EQ(seen.size(), 3u);
    EXPECT_EQ(owner->state_value(), ChannelState::Loading);
}

TEST_F(ChannelManagerTest, NullAndGarbageFramesAreDropped) {
    owner->start_socket(data_for("client", owner_events));

    auto peer = test_support::raw_exchange(io, port,
        "GET /ws HTTP/1.1\r\nUpgrade: nearlink-frames/1\r\nX-Socket-Type: message\r\n\r\n");
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner->state_value() == ChannelState::Connected; }));

    MessageCodec codec;
    auto text = TextRequest::create("after the noise");
    peer->write(test_support::frame("") +
                test_support::frame("not a sealed envelope") +
                test_support::frame(codec.encode(text, DeviceInfo{"liar", "Mallory"})));

    ASSERT_TRUE(test_support::run_until(io, [&] { return owner_events.messages.size() == 1; }));
    EXPECT_EQ(owner_events.messages[0].content, MessageContent{text});
    EXPECT_EQ(owner_events.messages[0].sender.id, "client");
    EXPECT_EQ(owner->state_value(), ChannelState::Connected);
    EXPECT_TRUE(owner_events.errors.empty());
}

TEST_F(ChannelManagerTest, PeerHangupEndsSubscription) {
    owner->start_socket(data_for("client", owner_events));

    auto peer = test_support::raw_exchange(io, port,
        "GET /ws HTTP/1.1\r\nUpgrade: nearlink-frames/1\r\nX-Socket-Type: message\r\n\r\n");
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner->state_value() == ChannelState::Connected; }));

    asio::error_code ignored;
    peer->socket.close(ignored);
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner_events.done == 1; }));
    EXPECT_EQ(owner->state_value(), ChannelState::NotConnected);
}

TEST_F(ChannelManagerTest, AcceptedFilesOpenTransferSocket) {
    ASSERT_TRUE(connect_both());

    std::vector<std::string> owner_chunks;
    bool client_open = false;

    // Listeners are fixed at start_socket time; restart both with file sinks.
    owner->cancel();
    client->cancel();

    auto owner_data = data_for("client", owner_events);
    owner_data.files_listener.on_data = [&](const std::string&, const std::string& chunk) {
        owner_chunks.push_back(chunk);
    };
    auto client_data = data_for("owner", client_events);
    client_data.files_listener.on_created = [&](const FileTransferSession&) { client_open = true; };

    owner->start_socket(std::move(owner_data));
    client->start_socket(std::move(client_data));
    ASSERT_TRUE(test_support::run_until(io, [&] {
        return owner->state_value() == ChannelState::Connected &&
               client->state_value() == ChannelState::Connected;
    }));

    auto offer = FilesRequest::create({{"photo.jpg", 4}});
    ASSERT_TRUE(client->send(OutgoingMessage{offer, DeviceInfo{"owner", ""}}));
    ASSERT_TRUE(test_support::run_until(io, [&] {
        return owner->file_sockets().session(offer.id).has_value();
    }));
    EXPECT_EQ(owner->file_sockets().session(offer.id)->direction, TransferDirection::Response);
    EXPECT_EQ(client->file_sockets().session(offer.id)->direction, TransferDirection::Request);

    ASSERT_TRUE(owner->send(OutgoingMessage{FilesResponse{offer.id, true}, DeviceInfo{"client", ""}}));
    ASSERT_TRUE(test_support::run_until(io, [&] {
        return client_open && owner->file_sockets().open_socket_count() == 1;
    }));

    EXPECT_TRUE(client->file_sockets().send(offer.id, "data"));
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner_chunks.size() == 1; }));
    EXPECT_EQ(owner_chunks[0], "data");

    // File traffic never reaches the message listener.
    EXPECT_EQ(owner->state_value(), ChannelState::Connected);
    const auto owner_messages = owner_events.messages.size();
    test_support::run_for(io, 50ms);
    EXPECT_EQ(owner_events.messages.size(), owner_messages);

    owner->cancel();
    EXPECT_EQ(owner->file_sockets().session_count(), 0u);
}

TEST_F(ChannelManagerTest, DeclinedFilesRetireTransfer) {
    ASSERT_TRUE(connect_both());

    auto offer = FilesRequest::create({{"a.bin", 1}});
    ASSERT_TRUE(client->send(OutgoingMessage{offer, DeviceInfo{"owner", ""}}));
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner_events.messages.size() == 1; }));

    ASSERT_TRUE(owner->send(OutgoingMessage{FilesResponse{offer.id, false}, DeviceInfo{"client", ""}}));
    ASSERT_TRUE(test_support::run_until(io, [&] { return client_events.messages.size() == 1; }));

    EXPECT_FALSE(owner->file_sockets().session(offer.id).has_value());
    EXPECT_FALSE(client->file_sockets().session(offer.id).has_value());
    EXPECT_EQ(client->file_sockets().open_socket_count(), 0u);
}

namespace {

const char kMessageUpgrade[] =
    "GET /ws HTTP/1.1\r\nUpgrade: nearlink-frames/1\r\nX-Socket-Type: message\r\n\r\n";

// Length prefix one byte over the frame limit.
std::string oversized_header() {
    const uint32_t n = FramedSocket::kMaxFrameSize + 1;
    std::string out;
    out += static_cast<char>((n >> 24) & 0xff);
    out += static_cast<char>((n >> 16) & 0xff);
    out += static_cast<char>((n >> 8) & 0xff);
    out += static_cast<char>(n & 0xff);
    return out;
}

} // namespace

TEST_F(ChannelManagerTest, SocketErrorWithCancelOnErrorDropsSubscription) {
    owner->start_socket(data_for("client", owner_events, true));

    auto peer = test_support::raw_exchange(io, port, kMessageUpgrade);
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner->state_value() == ChannelState::Connected; }));

    peer->write(oversized_header());
    ASSERT_TRUE(test_support::run_until(io, [&] { return !owner_events.errors.empty(); }));
    test_support::run_for(io, 50ms);

    ASSERT_EQ(owner_events.errors.size(), 1u);
    EXPECT_EQ(owner_events.errors[0], asio::error_code(asio::error::message_size));
    EXPECT_EQ(owner_events.done, 0);
    EXPECT_EQ(owner->state_value(), ChannelState::NotConnected);
    EXPECT_FALSE(owner->send(OutgoingMessage{TextRequest::create("hi"), DeviceInfo{"client", ""}}));
    EXPECT_TRUE(test_support::run_until(io, [&] { return peer->done; }));
}

TEST_F(ChannelManagerTest, SocketErrorReportsErrorThenDone) {
    owner->start_socket(data_for("client", owner_events, false));

    auto peer = test_support::raw_exchange(io, port, kMessageUpgrade);
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner->state_value() == ChannelState::Connected; }));

    peer->write(oversized_header());
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner_events.done == 1; }));

    ASSERT_EQ(owner_events.errors.size(), 1u);
    EXPECT_EQ(owner_events.errors[0], asio::error_code(asio::error::message_size));
    ASSERT_EQ(owner_events.order.size(), 3u);
    EXPECT_EQ(owner_events.order[0], "created");
    EXPECT_EQ(owner_events.order[1], "error");
    EXPECT_EQ(owner_events.order[2], "done");
    EXPECT_EQ(owner->state_value(), ChannelState::NotConnected);
}

TEST_F(ChannelManagerTest, RequestsInFlightAtCancelAreDropped) {
    std::vector<std::string> seen;
    auto data = data_for("client", owner_events);
    data.config.request_observer = [&](const HttpRequest& r) { seen.push_back(r.path); };
    owner->start_socket(std::move(data));

    // Both peers stall before the end of their request head.
    auto file_peer = test_support::raw_exchange(io, port, "GET /ws HTTP/1.1\r\n");
    auto ping_peer = test_support::raw_exchange(io, port, "GET /ping?token=");
    test_support::run_for(io, 100ms);

    EXPECT_TRUE(owner->cancel());

    file_peer->write("Upgrade: nearlink-frames/1\r\nX-Socket-Type: file\r\nX-Transfer-Id: t9\r\n\r\n");
    PingManager pings;
    ping_peer->write(pings.build_ping() + " HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(test_support::run_until(io, [&] { return file_peer->done && ping_peer->done; }));

    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(owner->file_sockets().session_count(), 0u);
    EXPECT_EQ(owner->file_sockets().open_socket_count(), 0u);
    EXPECT_EQ(file_peer->response.find("101"), std::string::npos);
    EXPECT_EQ(ping_peer->response.find("pong:"), std::string::npos);
    EXPECT_EQ(owner->state_value(), ChannelState::NotConnected);
}

TEST_F(ChannelManagerTest, RestartedServerIgnoresOldConnections) {
    std::vector<std::string> seen;
    auto first = data_for("client", owner_events);
    first.config.request_observer = [&](const HttpRequest& r) { seen.push_back("old " + r.path); };
    owner->start_socket(std::move(first));

    auto stale = test_support::raw_exchange(io, port, "GET /ws HTTP/1.1\r\n");
    test_support::run_for(io, 100ms);

    owner->cancel();
    auto second = data_for("client", owner_events);
    second.config.request_observer = [&](const HttpRequest& r) { seen.push_back("new " + r.path); };
    owner->start_socket(std::move(second));

    stale->write("X-Socket-Type: message\r\n\r\n");
    ASSERT_TRUE(test_support::run_until(io, [&] { return stale->done; }));
    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(owner->state_value(), ChannelState::Loading);

    // The new server still routes fresh connections.
    auto fresh = test_support::raw_exchange(io, port, kMessageUpgrade);
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner->state_value() == ChannelState::Connected; }));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "new /ws");
}

TEST_F(ChannelManagerTest, ThrowingListenerStaysInsideChannel) {
    auto data = data_for("client", owner_events);
    data.messages_listener.on_created = []() { throw std::runtime_error("created boom"); };
    data.messages_listener.on_data = [](const ReceivedMessage&) { throw std::runtime_error("data boom"); };
    data.messages_listener.on_done = []() { throw std::runtime_error("done boom"); };
    owner->start_socket(std::move(data));
    client->start_socket(data_for("owner", client_events));

    // An exception escaping a listener would leave io.run_for() and fail the test.
    ASSERT_TRUE(test_support::run_until(io, [&] {
        return owner->state_value() == ChannelState::Connected &&
               client->state_value() == ChannelState::Connected;
    }));
    EXPECT_TRUE(client->send(OutgoingMessage{TextRequest::create("hi"), DeviceInfo{"owner", ""}}));
    test_support::run_for(io, 50ms);

    client->cancel();
    ASSERT_TRUE(test_support::run_until(io, [&] {
        return owner->state_value() == ChannelState::NotConnected;
    }));
}

TEST_F(ChannelManagerTest, FileSocketOutlivesMessageSocketDrop) {
    owner->start_socket(data_for("client", owner_events));

    auto message_peer = test_support::raw_exchange(io, port, kMessageUpgrade);
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner->state_value() == ChannelState::Connected; }));

    auto file_peer = test_support::raw_exchange(io, port,
        "GET /ws HTTP/1.1\r\nUpgrade: nearlink-frames/1\r\nX-Socket-Type: file\r\nX-Transfer-Id: t7\r\n\r\n");
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner->file_sockets().open_socket_count() == 1; }));

    asio::error_code ignored;
    message_peer->socket.close(ignored);
    ASSERT_TRUE(test_support::run_until(io, [&] { return owner_events.done == 1; }));

    EXPECT_EQ(owner->state_value(), ChannelState::NotConnected);
    EXPECT_EQ(owner->file_sockets().open_socket_count(), 1u);
    EXPECT_TRUE(owner->file_sockets().send("t7", "still here"));

    owner->cancel();
    EXPECT_EQ(owner->file_sockets().session_count(), 0u);
}
