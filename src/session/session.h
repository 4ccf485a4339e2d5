#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "concurrency/notifier.h"
#include "concurrency/tick_queue.h"
#include "net/i_socket.h"
#include "types/enums.h"
#include "types/session_types.h"

namespace session {

class FrontendSession;
class SessionService;

// Payload of bind/unbind/closed notifications. `session` and `reason` are set for CLOSED only.
struct SessionEventArgs {
    std::optional<Uid> uid;
    std::shared_ptr<FrontendSession> session;
    std::string reason;
};

using SessionNotifier = concurrency::Notifier<SessionEvent, const SessionEventArgs&>;

/**
 * Server-side record of one live client connection.
 *
 * A Session is created by SessionService::create() and owned by the service's session table.
 * It must not be handed to handler code; use toFrontendSession() instead.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    using Ptr = std::shared_ptr<Session>;

    Session(SessionId sid, const std::string& frontendId, net::ISocket::Ptr socket,
            SessionService* service, concurrency::TickQueue& ticks);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    SessionId id() const { return id_; }
    const std::string& frontendId() const { return frontend_id_; }
    const std::optional<Uid>& uid() const { return uid_; }
    const Settings& settings() const { return settings_; }
    SessionState state() const { return state_; }
    SessionService* service() const { return service_; }
    const net::ISocket::Ptr& socket() const { return socket_; }

    std::shared_ptr<FrontendSession> toFrontendSession();

    // Low-level primitives; SessionService performs all invariant checks before calling these.
    void bind(Uid uid);
    void unbind(Uid uid);

    void set(const std::string& key, const SettingValue& value);
    void set(const Settings& values);
    std::optional<SettingValue> get(const std::string& key) const;
    // Only ever touches the settings store.
    void remove(const std::string& key);

    void send(const nlohmann::json& msg);
    void sendBatch(const std::vector<nlohmann::json>& msgs);

    /**
     * Terminal transition, idempotent. Deregisters from the service, emits CLOSED with a fresh
     * FrontendSession snapshot, emits "closing" on the socket and schedules disconnect() for the
     * next tick so that CLOSED listeners run before the transport is torn down.
     */
    void closed(const std::string& reason);

    std::optional<RemoteAddress> remoteAddress() const;

    SessionNotifier& events() { return events_; }

private:
    friend class SessionService;
    void detachService() { service_ = nullptr; }

    SessionId id_;
    std::string frontend_id_;
    std::optional<Uid> uid_;
    Settings settings_;
    SessionState state_{SessionState::INITED};

    net::ISocket::Ptr socket_{nullptr};
    SessionService* service_{nullptr}; // non-owning
    concurrency::TickQueue& ticks_;
    SessionNotifier events_;
};

} // namespace session
