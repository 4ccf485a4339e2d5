#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "i_socket.h"
#include "types/enums.h"
#include "types/message.h"

namespace net {

struct Frame {
    MessageType type{MessageType::REQUEST};
    nlohmann::json body;
};

enum class ReadStatus {
    DATA,        // at least one byte was appended to the read buffer
    WOULD_BLOCK, // nothing available right now
    PEER_CLOSED,
    FAILED
};

enum class FrameStatus {
    COMPLETE,
    INCOMPLETE, // the buffer holds less than one frame
    MALFORMED   // a whole frame was consumed but its body is not JSON
};

/**
 * ISocket over a connected TCP fd using the MessageHeader framing in types/message.h.
 *
 * Works on both blocking and non-blocking fds. Inbound bytes accumulate in a per-connection
 * buffer and are cut into frames by nextFrame(), so a peer that stops mid-frame never holds the
 * caller. Outbound frames go through a pending buffer: on a non-blocking fd whatever the kernel
 * does not take is kept until flush() is called again on writability.
 */
class FdSocket : public ISocket {
public:
    using Ptr = std::shared_ptr<FdSocket>;

    // Upper bound on queued outbound bytes; frames past it are dropped.
    static constexpr size_t MAX_PENDING_OUTPUT = 16 * MAX_MESSAGE_SIZE;

    explicit FdSocket(int socket_fd);
    ~FdSocket() override;

    FdSocket(const FdSocket&) = delete;
    FdSocket& operator=(const FdSocket&) = delete;

    // NOTIFICATION frame.
    void send(const nlohmann::json& msg) override;
    // One BATCH frame whose body is a JSON array.
    void sendBatch(const std::vector<nlohmann::json>& msgs) override;
    // Tries once to flush pending output, then shuts the fd down. Idempotent.
    void disconnect() override;
    std::optional<RemoteAddress> remoteAddress() const override;

    // Queues one frame and flushes as much as the fd accepts. False when the frame was dropped
    // or the fd failed.
    bool sendFrame(MessageType type, const nlohmann::json& body);
    bool flush();
    bool hasPendingOutput() const { return !out_buf_.empty(); }

    // Reads everything currently available into the read buffer. On a blocking fd the first
    // read waits for data.
    ReadStatus readAvailable();
    // Cuts the next frame off the read buffer without touching the fd.
    FrameStatus nextFrame(Frame& out);

    // Reads until one frame is available: 1 on success, 0 when the peer closed, -1 when a
    // non-blocking fd has no whole frame yet, -2 on error, -3 for a malformed body.
    int recvFrame(Frame& out);

    int getSocketFD() const { return socket_fd_; }
    bool is_open() const { return socket_fd_ >= 0; }
    size_t bufferedInput() const { return in_buf_.size(); }

private:
    int socket_fd_;
    std::string in_buf_;
    std::string out_buf_;
};

} // namespace net
