#include "fd_socket.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include "common/debug.h"

namespace net {

FdSocket::FdSocket(int socket_fd) : socket_fd_(socket_fd) {
    if (socket_fd < 0) {
        error_cpp20("Invalid socket file descriptor");
    }
}

FdSocket::~FdSocket() {
    disconnect();
}

void FdSocket::send(const nlohmann::json& msg) {
    sendFrame(MessageType::NOTIFICATION, msg);
}

void FdSocket::sendBatch(const std::vector<nlohmann::json>& msgs) {
    sendFrame(MessageType::BATCH, nlohmann::json(msgs));
}

void FdSocket::disconnect() {
    if (socket_fd_ < 0) return;
    if (hasPendingOutput() && flush() && hasPendingOutput()) {
        log_cpp20("[FdSocket] fd=" + std::to_string(socket_fd_) + " dropping " +
                  std::to_string(out_buf_.size()) + " unsent bytes on disconnect");
    }
    ::shutdown(socket_fd_, SHUT_RDWR);
    ::close(socket_fd_);
    log_cpp20("[FdSocket] disconnected fd=" + std::to_string(socket_fd_));
    socket_fd_ = -1;
    in_buf_.clear();
    out_buf_.clear();
}

std::optional<RemoteAddress> FdSocket::remoteAddress() const {
    if (socket_fd_ < 0) return std::nullopt;
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    ::memset(&addr, 0, sizeof(addr));
    if (::getpeername(socket_fd_, (struct sockaddr*)&addr, &len) < 0 || addr.sin_family != AF_INET) {
        return std::nullopt;
    }
    char ip[INET_ADDRSTRLEN] = {0};
    if (!::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip))) {
        return std::nullopt;
    }
    return RemoteAddress{ip, ntohs(addr.sin_port)};
}

bool FdSocket::sendFrame(MessageType type, const nlohmann::json& body) {
    if (socket_fd_ < 0) {
        log_cpp20("[FdSocket] drop frame on closed socket");
        return false;
    }
    std::string payload = body.dump();
    if (payload.size() > MAX_BODY_SIZE) {
        error_cpp20("Frame body too large: " + std::to_string(payload.size()) + " bytes");
        return false;
    }
    if (out_buf_.size() + sizeof(MessageHeader) + payload.size() > MAX_PENDING_OUTPUT) {
        error_cpp20("Output backlog full on fd " + std::to_string(socket_fd_) + ", dropping frame");
        return false;
    }
    MessageHeader header;
    header.length = htons(static_cast<uint16_t>(payload.size()));
    header.type = static_cast<uint8_t>(type);

    out_buf_.append(reinterpret_cast<const char*>(&header), sizeof(header));
    out_buf_ += payload;
    return flush();
}

bool FdSocket::flush() {
    while (!out_buf_.empty()) {
        if (socket_fd_ < 0) return false;
        ssize_t sent = ::send(socket_fd_, out_buf_.data(), out_buf_.size(), MSG_NOSIGNAL);
        if (sent > 0) {
            out_buf_.erase(0, static_cast<size_t>(sent));
            continue;
        }
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            log_cpp20("[FdSocket] fd=" + std::to_string(socket_fd_) + " kernel buffer full, " +
                      std::to_string(out_buf_.size()) + " bytes pending");
            return true;
        }
        error_cpp20("send failed on fd " + std::to_string(socket_fd_) + ": " + std::string(strerror(errno)));
        out_buf_.clear();
        return false;
    }
    return true;
}

ReadStatus FdSocket::readAvailable() {
    if (socket_fd_ < 0) return ReadStatus::FAILED;

    char chunk[4096];
    bool got_data = false;
    // the first read follows the fd's own mode; later ones only take what is already there
    int flags = 0;
    while (in_buf_.size() < MAX_MESSAGE_SIZE) {
        ssize_t received = ::recv(socket_fd_, chunk, sizeof(chunk), flags);
        if (received > 0) {
            in_buf_.append(chunk, static_cast<size_t>(received));
            got_data = true;
            flags = MSG_DONTWAIT;
            continue;
        }
        if (received == 0) {
            // EOF is seen again on the next call, after the buffered frames are consumed
            if (got_data) return ReadStatus::DATA;
            log_cpp20("Connection closed by peer on fd " + std::to_string(socket_fd_));
            return ReadStatus::PEER_CLOSED;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return got_data ? ReadStatus::DATA : ReadStatus::WOULD_BLOCK;
        }
        error_cpp20("recv failed on fd " + std::to_string(socket_fd_) + ": " + std::string(strerror(errno)));
        return got_data ? ReadStatus::DATA : ReadStatus::FAILED;
    }
    return ReadStatus::DATA;
}

FrameStatus FdSocket::nextFrame(Frame& out) {
    if (in_buf_.size() < sizeof(MessageHeader)) {
        return FrameStatus::INCOMPLETE;
    }
    MessageHeader header;
    ::memcpy(&header, in_buf_.data(), sizeof(header));
    size_t length = ntohs(header.length);
    if (in_buf_.size() < sizeof(header) + length) {
        return FrameStatus::INCOMPLETE;
    }

    std::string payload = in_buf_.substr(sizeof(header), length);
    in_buf_.erase(0, sizeof(header) + length);

    out.type = static_cast<MessageType>(header.type);
    if (length > MAX_BODY_SIZE) {
        error_cpp20("Oversized frame on fd " + std::to_string(socket_fd_) + ": " + std::to_string(length) + " bytes");
        return FrameStatus::MALFORMED;
    }
    out.body = nlohmann::json::parse(payload, nullptr, false);
    if (out.body.is_discarded()) {
        error_cpp20("Malformed JSON frame on fd " + std::to_string(socket_fd_));
        return FrameStatus::MALFORMED;
    }
    return FrameStatus::COMPLETE;
}

int FdSocket::recvFrame(Frame& out) {
    while (true) {
        switch (nextFrame(out)) {
            case FrameStatus::COMPLETE: return 1;
            case FrameStatus::MALFORMED: return -3;
            case FrameStatus::INCOMPLETE: break;
        }
        switch (readAvailable()) {
            case ReadStatus::DATA: continue;
            case ReadStatus::WOULD_BLOCK: return -1;
            case ReadStatus::PEER_CLOSED: return 0;
            case ReadStatus::FAILED: return -2;
        }
    }
}

} // namespace net
