#pragma once

#include <sys/epoll.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include "concurrency/tick_queue.h"
#include "config/server_config.h"
#include "handlers/command_handler.h"
#include "net/fd_socket.h"
#include "session/session_service.h"

namespace server {

/**
 * Single-threaded frontend loop.
 *
 * Every accepted connection becomes a Session (sids count up from 1) with its own
 * CommandHandler. Each loop turn polls the sockets, dispatches every complete frame and then
 * drains the TickQueue, which is where every deferred session callback runs.
 * All sockets are non-blocking: a peer that stops mid-frame only parks bytes in its own
 * connection buffer and a peer that stops reading only grows its own output backlog.
 */
class FrontendServer {
public:
    static constexpr int MAX_EVENTS = 256;

    explicit FrontendServer(const config::ServerConfig& config);
    ~FrontendServer();

    FrontendServer(const FrontendServer&) = delete;
    FrontendServer& operator=(const FrontendServer&) = delete;

    bool start();
    // Loops until stop() or a fatal poll error.
    void run();
    // One loop turn; false on a fatal poll error.
    bool runOnce();
    // Safe to call from a signal handler.
    void stop() { running_.store(false, std::memory_order_release); }

    // Bound port, 0 before start().
    uint16_t port() const { return bound_port_; }
    size_t connectionCount() const { return connections_.size(); }
    session::SessionService& sessionService() { return session_service_; }
    concurrency::TickQueue& ticks() { return ticks_; }

private:
    struct Connection {
        net::FdSocket::Ptr socket{nullptr};
        SessionId sid{0};
        handlers::CommandHandler::Ptr handler{nullptr};
        bool watching_write{false};
    };

    bool openListenSocket();
    bool watch(int fd, uint32_t events, int op = EPOLL_CTL_ADD);
    void unwatch(int fd);

    void onAccept();
    void onReadable(int fd);
    void onWritable(int fd);
    void dispatchFrame(Connection& conn, net::Frame& frame);
    // Turns EPOLLOUT on for sockets with a backlog and off once it has drained.
    void syncWriteInterest();
    void closeConnection(int fd, const std::string& reason);
    void releaseConnection(int fd, const net::FdSocket::Ptr& socket);

    config::ServerConfig config_;
    concurrency::TickQueue ticks_;
    session::SessionService session_service_;
    int epoll_fd_{-1};
    int listen_fd_{-1};
    uint16_t bound_port_{0};
    std::unordered_map<int, Connection> connections_;
    SessionId next_session_id_{1};
    std::atomic<bool> running_{false};
};

} // namespace server
