#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "net/fd_socket.h"
#include "loopback.h"

using net::FdSocket;
using net::Frame;
using net::FrameStatus;
using net::ReadStatus;

// A connected loopback pair: `server` from accept(), `client` from connect().
class FdSocketTest : public ::testing::Test {
protected:
    int listen_fd{-1};
    uint16_t port{0};
    std::unique_ptr<FdSocket> server;
    std::unique_ptr<FdSocket> client;

    void SetUp() override {
        listen_fd = loopback::listenAny(port);
        ASSERT_GE(listen_fd, 0);
    }

    void TearDown() override {
        if (listen_fd >= 0) ::close(listen_fd);
    }

    void connectPair(bool nonblockingServer = false) {
        int fd = loopback::connectTo(port);
        ASSERT_GE(fd, 0);
        client = std::make_unique<FdSocket>(fd);
        int accepted = loopback::acceptOne(listen_fd, nonblockingServer);
        ASSERT_GE(accepted, 0);
        server = std::make_unique<FdSocket>(accepted);
    }
};

TEST_F(FdSocketTest, FrameRoundTrip) {
    connectPair();
    ASSERT_TRUE(client->sendFrame(MessageType::REQUEST, {{"command", "bind"}, {"params", {{"uid", 42}}}}));
    Frame frame;
    ASSERT_EQ(server->recvFrame(frame), 1);
    EXPECT_EQ(frame.type, MessageType::REQUEST);
    EXPECT_EQ(frame.body["command"].get<std::string>(), "bind");
    EXPECT_EQ(frame.body["params"]["uid"].get<int>(), 42);
}

TEST_F(FdSocketTest, SendUsesNotificationAndBatchFrames) {
    connectPair();
    server->send({{"route", "onChat"}});
    server->sendBatch({nlohmann::json{{"n", 1}}, nlohmann::json{{"n", 2}}});

    Frame frame;
    ASSERT_EQ(client->recvFrame(frame), 1);
    EXPECT_EQ(frame.type, MessageType::NOTIFICATION);
    EXPECT_EQ(frame.body["route"].get<std::string>(), "onChat");

    ASSERT_EQ(client->recvFrame(frame), 1);
    EXPECT_EQ(frame.type, MessageType::BATCH);
    ASSERT_TRUE(frame.body.is_array());
    EXPECT_EQ(frame.body.size(), 2u);
    EXPECT_EQ(frame.body[1]["n"].get<int>(), 2);
}

TEST_F(FdSocketTest, MalformedBodyIsReportedAndConsumed) {
    connectPair();
    std::string raw = loopback::wireFrame(MessageType::REQUEST, "{oops");
    raw += loopback::wireFrame(MessageType::REQUEST, R"({"command":"count"})");
    ASSERT_TRUE(loopback::writeRaw(client->getSocketFD(), raw));

    Frame frame;
    EXPECT_EQ(server->recvFrame(frame), -3);
    // the bad frame does not poison the stream
    ASSERT_EQ(server->recvFrame(frame), 1);
    EXPECT_EQ(frame.body["command"].get<std::string>(), "count");
}

TEST_F(FdSocketTest, PartialFrameWaitsInBufferOnNonBlockingFd) {
    connectPair(true);
    const std::string raw = loopback::wireFrame(MessageType::REQUEST, R"({"command":"count"})");

    Frame frame;
    EXPECT_EQ(server->readAvailable(), ReadStatus::WOULD_BLOCK);
    EXPECT_EQ(server->recvFrame(frame), -1);

    ASSERT_TRUE(loopback::writeRaw(client->getSocketFD(), raw.substr(0, 1)));
    EXPECT_EQ(server->readAvailable(), ReadStatus::DATA);
    EXPECT_EQ(server->nextFrame(frame), FrameStatus::INCOMPLETE);
    EXPECT_EQ(server->bufferedInput(), 1u);

    // header complete, body still short
    ASSERT_TRUE(loopback::writeRaw(client->getSocketFD(), raw.substr(1, 6)));
    EXPECT_EQ(server->recvFrame(frame), -1);
    EXPECT_EQ(server->bufferedInput(), 7u);

    ASSERT_TRUE(loopback::writeRaw(client->getSocketFD(), raw.substr(7)));
    ASSERT_EQ(server->recvFrame(frame), 1);
    EXPECT_EQ(frame.body["command"].get<std::string>(), "count");
    EXPECT_EQ(server->bufferedInput(), 0u);
}

TEST_F(FdSocketTest, SeveralFramesInOneReadAreSplit) {
    connectPair(true);
    std::string raw;
    for (int i = 0; i < 3; ++i) {
        raw += loopback::wireFrame(MessageType::REQUEST, nlohmann::json{{"n", i}}.dump());
    }
    ASSERT_TRUE(loopback::writeRaw(client->getSocketFD(), raw));

    ASSERT_EQ(server->readAvailable(), ReadStatus::DATA);
    Frame frame;
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(server->nextFrame(frame), FrameStatus::COMPLETE);
        EXPECT_EQ(frame.body["n"].get<int>(), i);
    }
    EXPECT_EQ(server->nextFrame(frame), FrameStatus::INCOMPLETE);
}

TEST_F(FdSocketTest, BacklogIsKeptWhenPeerStopsReading) {
    connectPair(true);
    const std::string big(4000, 'x');
    int accepted = 0;
    // the peer never reads, so the kernel buffers fill and the rest stays queued
    while (!server->hasPendingOutput() && accepted < 10000) {
        ASSERT_TRUE(server->sendFrame(MessageType::NOTIFICATION, {{"pad", big}}));
        ++accepted;
    }
    EXPECT_TRUE(server->hasPendingOutput());

    Frame frame;
    ASSERT_EQ(client->recvFrame(frame), 1);
    EXPECT_EQ(frame.body["pad"].get<std::string>().size(), big.size());
}

TEST_F(FdSocketTest, RemoteAddressIsLoopback) {
    connectPair();
    auto addr = server->remoteAddress();
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(addr->ip, "127.0.0.1");
    EXPECT_NE(addr->port, 0);
}

TEST_F(FdSocketTest, DisconnectIsIdempotentAndSeenByPeer) {
    connectPair();
    client->disconnect();
    client->disconnect();
    EXPECT_FALSE(client->is_open());
    EXPECT_FALSE(client->remoteAddress().has_value());
    EXPECT_FALSE(client->sendFrame(MessageType::REQUEST, nlohmann::json::object()));

    Frame frame;
    EXPECT_EQ(server->recvFrame(frame), 0);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
