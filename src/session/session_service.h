#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "concurrency/tick_queue.h"
#include "net/i_socket.h"
#include "session.h"
#include "session_error.h"
#include "types/session_types.h"

namespace session {

struct SessionServiceConfig {
    // At most one bound session per uid.
    bool singleSession{false};
};

/**
 * Frontend-local registry of live sessions.
 *
 * Owns the sid -> Session table and the uid -> [Session] index. A bound session appears in
 * exactly one uid bucket and empty buckets are erased. bind/unbind/kick results are always
 * delivered on the next tick of the TickQueue, never from inside the call.
 * Single-threaded: every method must be called from the loop that drains `ticks`.
 */
class SessionService {
public:
    using SessionVisitor = std::function<void(const Session::Ptr&)>;

    static constexpr const char* DEFAULT_KICK_REASON = "kick";

    explicit SessionService(concurrency::TickQueue& ticks, SessionServiceConfig config = {});
    ~SessionService();

    SessionService(const SessionService&) = delete;
    SessionService& operator=(const SessionService&) = delete;

    // The caller guarantees sid is unique. A duplicate replaces the previous entry, which is
    // dropped from its uid bucket and detached from the service.
    Session::Ptr create(SessionId sid, const std::string& frontendId, net::ISocket::Ptr socket);

    void bind(SessionId sid, Uid uid, Callback cb);
    void unbind(SessionId sid, Uid uid, Callback cb);

    Session::Ptr get(SessionId sid) const;
    // std::nullopt when no session is bound to uid.
    std::optional<std::vector<Session::Ptr>> getByUid(Uid uid) const;

    void remove(SessionId sid);

    // Callbacks of import/importAll run synchronously. importAll rejects a non-object
    // with InvalidSettings and leaves the session untouched.
    void import(SessionId sid, const std::string& key, const SettingValue& value, Callback cb);
    void importAll(SessionId sid, const Settings& settings, Callback cb);

    void kick(Uid uid, const std::string& reason, Callback cb);
    void kick(Uid uid, Callback cb);
    void kickBySessionId(SessionId sid, const std::string& reason, Callback cb);
    void kickBySessionId(SessionId sid, Callback cb);

    std::optional<RemoteAddress> getClientAddressBySessionId(SessionId sid) const;

    bool sendMessage(SessionId sid, const nlohmann::json& msg);
    bool sendMessageByUid(Uid uid, const nlohmann::json& msg);

    // Both iterate over a snapshot; the visitor may close sessions.
    void forEachSession(const SessionVisitor& fn) const;
    void forEachBindedSession(const SessionVisitor& fn) const;

    size_t getSessionsCount() const { return sessions_.size(); }
    bool singleSession() const { return config_.singleSession; }
    concurrency::TickQueue& ticks() { return ticks_; }

private:
    void defer(Callback cb, std::optional<SessionError> err = std::nullopt);

    concurrency::TickQueue& ticks_;
    SessionServiceConfig config_;
    std::unordered_map<SessionId, Session::Ptr> sessions_;
    std::unordered_map<Uid, std::vector<Session::Ptr>> uid_map_;
};

} // namespace session
