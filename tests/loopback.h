#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstdint>
#include <cstring>
#include <string>

#include "types/enums.h"
#include "types/message.h"

// Loopback TCP helpers for the transport and server tests.
namespace loopback {

// Listening socket on 127.0.0.1 with a kernel-chosen port; -1 on failure.
inline int listenAny(uint16_t& port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;
    struct sockaddr_in addr;
    ::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    socklen_t len = sizeof(addr);
    if (::bind(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0 || ::listen(fd, 8) < 0 ||
        ::getsockname(fd, (struct sockaddr*)&addr, &len) < 0) {
        ::close(fd);
        return -1;
    }
    port = ntohs(addr.sin_port);
    return fd;
}

// Blocking client connected to 127.0.0.1:port; -1 on failure.
inline int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;
    struct sockaddr_in addr;
    ::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, (struct sockaddr*)&addr, sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

inline int acceptOne(int listen_fd, bool nonblocking) {
    return ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC | (nonblocking ? SOCK_NONBLOCK : 0));
}

// Header plus body exactly as it goes over the wire.
inline std::string wireFrame(MessageType type, const std::string& body) {
    MessageHeader header;
    header.length = htons(static_cast<uint16_t>(body.size()));
    header.type = static_cast<uint8_t>(type);
    return std::string(reinterpret_cast<const char*>(&header), sizeof(header)) + body;
}

inline bool writeRaw(int fd, const std::string& bytes) {
    size_t offset = 0;
    while (offset < bytes.size()) {
        ssize_t n = ::send(fd, bytes.data() + offset, bytes.size() - offset, MSG_NOSIGNAL);
        if (n <= 0) return false;
        offset += static_cast<size_t>(n);
    }
    return true;
}

} // namespace loopback
