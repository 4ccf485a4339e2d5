#include "frontend_server.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <vector>

#include "common/debug.h"
#include "protocol/error_codes.h"
#include "protocol/response_builder.h"

namespace server {

FrontendServer::FrontendServer(const config::ServerConfig& config)
    : config_(config), session_service_(ticks_, config.sessionServiceConfig()) {}

FrontendServer::~FrontendServer() {
    stop();
    if (listen_fd_ >= 0) ::close(listen_fd_);
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
}

bool FrontendServer::start() {
    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        error_cpp20("epoll_create1 failed: " + std::string(strerror(errno)));
        return false;
    }
    if (!openListenSocket()) {
        error_cpp20("Failed to listen on " + config_.host + ":" + std::to_string(config_.port));
        return false;
    }
    if (!watch(listen_fd_, EPOLLIN)) {
        return false;
    }
    running_.store(true, std::memory_order_release);
    log_cpp20("[FrontendServer] " + config_.frontendId + " started on port " + std::to_string(port()));
    return true;
}

bool FrontendServer::openListenSocket() {
    struct sockaddr_in addr;
    ::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (::inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
        error_cpp20("Invalid listen address: " + config_.host);
        return false;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        error_cpp20("socket failed: " + std::string(strerror(errno)));
        return false;
    }
    int opt = 1;
    if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        error_cpp20("setsockopt(SO_REUSEADDR) failed: " + std::string(strerror(errno)));
    }
    if (::bind(listen_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0 ||
        ::listen(listen_fd_, SOMAXCONN) < 0) {
        error_cpp20("bind/listen failed: " + std::string(strerror(errno)));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    // port 0 asks the kernel for one; report what it picked
    socklen_t len = sizeof(addr);
    if (::getsockname(listen_fd_, (struct sockaddr*)&addr, &len) == 0) {
        bound_port_ = ntohs(addr.sin_port);
    }
    return true;
}

bool FrontendServer::watch(int fd, uint32_t events, int op) {
    struct epoll_event ev;
    ::memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;
    if (::epoll_ctl(epoll_fd_, op, fd, &ev) < 0) {
        error_cpp20("epoll_ctl failed for fd " + std::to_string(fd) + ": " + std::string(strerror(errno)));
        return false;
    }
    return true;
}

void FrontendServer::unwatch(int fd) {
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        log_cpp20("[FrontendServer] epoll_ctl DEL fd=" + std::to_string(fd) + ": " + std::string(strerror(errno)));
    }
}

void FrontendServer::run() {
    while (running_.load(std::memory_order_acquire)) {
        if (!runOnce()) break;
    }
    log_cpp20("[FrontendServer] loop exited");
}

bool FrontendServer::runOnce() {
    // do not sleep while deferred callbacks are waiting
    int timeout = ticks_.empty() ? config_.pollTimeoutMs : 0;
    std::vector<struct epoll_event> events(MAX_EVENTS);
    int n = ::epoll_wait(epoll_fd_, events.data(), MAX_EVENTS, timeout);
    if (n < 0) {
        if (errno != EINTR) {
            error_cpp20("epoll_wait failed: " + std::string(strerror(errno)));
            return false;
        }
        n = 0;
    }

    for (int i = 0; i < n; ++i) {
        int fd = events[i].data.fd;
        uint32_t flags = events[i].events;
        try {
            if (fd == listen_fd_) {
                onAccept();
                continue;
            }
            if (flags & (EPOLLIN | EPOLLRDHUP)) {
                onReadable(fd);
            } else if (flags & (EPOLLERR | EPOLLHUP)) {
                closeConnection(fd, "socket error");
                continue;
            }
            if (flags & EPOLLOUT) {
                onWritable(fd);
            }
        } catch (const std::exception& e) {
            error_cpp20("[FrontendServer] handler failed on fd " + std::to_string(fd) + ": " + e.what());
        }
    }

    try {
        ticks_.drain(config_.tickBudget);
    } catch (const std::exception& e) {
        error_cpp20(std::string("[FrontendServer] deferred callback failed: ") + e.what());
    }
    syncWriteInterest();
    return true;
}

void FrontendServer::onAccept() {
    while (true) {
        int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                error_cpp20("accept4 failed: " + std::string(strerror(errno)));
            }
            return;
        }

        auto socket = std::make_shared<net::FdSocket>(fd);
        SessionId sid = next_session_id_++;
        auto session = session_service_.create(sid, config_.frontendId, socket);

        std::weak_ptr<net::FdSocket> weak_socket = socket;
        auto handler = std::make_shared<handlers::CommandHandler>(session_service_, session->toFrontendSession(),
            [weak_socket](MessageType type, const nlohmann::json& body) {
                if (auto s = weak_socket.lock()) s->sendFrame(type, body);
            });

        socket->events().subscribe(SocketEvent::CLOSING, [this, fd, weak_socket](const std::string& reason) {
            log_cpp20("[FrontendServer] closing fd=" + std::to_string(fd) + " reason=" + reason);
            unwatch(fd);
            // runs ahead of the socket's own disconnect in the same tick
            ticks_.post([this, fd, weak_socket]() { releaseConnection(fd, weak_socket.lock()); });
        });

        connections_[fd] = Connection{socket, sid, handler, false};
        if (!watch(fd, EPOLLIN | EPOLLRDHUP)) {
            session->closed("socket error");
            continue;
        }
        log_cpp20("[FrontendServer] new connection fd=" + std::to_string(fd) + " sid=" + std::to_string(sid));
    }
}

void FrontendServer::onReadable(int fd) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) return;
    // keep the entry alive while handlers run; a handler may close this very session
    Connection conn = it->second;

    net::ReadStatus status = conn.socket->readAvailable();
    net::Frame frame;
    while (session_service_.get(conn.sid)) {
        net::FrameStatus fs = conn.socket->nextFrame(frame);
        if (fs == net::FrameStatus::INCOMPLETE) break;
        if (fs == net::FrameStatus::MALFORMED) {
            protocol::ResponseBuilder builder;
            conn.socket->sendFrame(MessageType::ERROR,
                builder.buildErrorResponse(static_cast<int>(ErrorCode::BAD_REQUEST), "malformed request"));
            continue;
        }
        dispatchFrame(conn, frame);
    }

    if (status == net::ReadStatus::PEER_CLOSED) {
        closeConnection(fd, "client closed");
    } else if (status == net::ReadStatus::FAILED) {
        closeConnection(fd, "socket error");
    } else if (conn.socket->bufferedInput() > 0) {
        log_cpp20("[FrontendServer] fd=" + std::to_string(fd) + " waiting for the rest of a frame, " +
                  std::to_string(conn.socket->bufferedInput()) + " bytes buffered");
    }
}

void FrontendServer::dispatchFrame(Connection& conn, net::Frame& frame) {
    if (frame.type != MessageType::REQUEST) {
        protocol::ResponseBuilder builder;
        conn.socket->sendFrame(MessageType::ERROR,
            builder.buildErrorResponse(static_cast<int>(ErrorCode::BAD_REQUEST), "expected a REQUEST frame"));
        return;
    }
    conn.handler->handle(frame.body);
}

void FrontendServer::onWritable(int fd) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) return;
    if (!it->second.socket->flush()) {
        closeConnection(fd, "socket error");
    }
}

void FrontendServer::syncWriteInterest() {
    for (auto& [fd, conn] : connections_) {
        if (!conn.socket->is_open() || !session_service_.get(conn.sid)) continue;
        bool wants_write = conn.socket->hasPendingOutput();
        if (wants_write == conn.watching_write) continue;
        uint32_t events = EPOLLIN | EPOLLRDHUP | (wants_write ? EPOLLOUT : 0u);
        if (watch(fd, events, EPOLL_CTL_MOD)) {
            conn.watching_write = wants_write;
        }
    }
}

void FrontendServer::closeConnection(int fd, const std::string& reason) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) return;
    if (auto session = session_service_.get(it->second.sid)) {
        session->closed(reason);
        return;
    }
    // session already gone, the socket still needs tearing down
    auto socket = it->second.socket;
    unwatch(fd);
    connections_.erase(it);
    socket->disconnect();
}

void FrontendServer::releaseConnection(int fd, const net::FdSocket::Ptr& socket) {
    // the fd number may already belong to a newer connection
    auto it = connections_.find(fd);
    if (it != connections_.end() && it->second.socket == socket) {
        connections_.erase(it);
    }
}

} // namespace server
