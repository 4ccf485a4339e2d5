#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "session.h"
#include "session_error.h"
#include "types/session_types.h"

namespace session {

// Handler-facing projection of a Session.
// Identity fields are copied and settings are deep-copied at construction; the copy is not
// live-linked. Identity changes go through SessionService and only the local uid mirror is updated.
// The service is reached through the underlying Session; once that Session is destroyed or detached,
// bind/unbind/push/pushAll fail immediately with SessionNotFound.
class FrontendSession : public std::enable_shared_from_this<FrontendSession> {
public:
    using Ptr = std::shared_ptr<FrontendSession>;

    explicit FrontendSession(Session& session);

    SessionId id() const { return id_; }
    const std::string& frontendId() const { return frontend_id_; }
    const std::optional<Uid>& uid() const { return uid_; }
    const Settings& settings() const { return settings_; }

    void bind(Uid uid, Callback cb);
    void unbind(Uid uid, Callback cb);

    void set(const std::string& key, const SettingValue& value);
    std::optional<SettingValue> get(const std::string& key) const;
    void remove(const std::string& key);

    // Write local settings back into the Session. A key missing locally is pushed as null.
    void push(const std::string& key, Callback cb);
    void pushAll(Callback cb);

    // Subscribes here and on the underlying Session while it is still alive.
    void on(SessionEvent event, SessionNotifier::Listener listener);

    // {id, frontendId, uid, settings}; uid is null when unbound.
    nlohmann::json exportSession() const;

    SessionNotifier& events() { return events_; }

private:
    SessionService* liveService() const;
    SessionError detachedError() const;

    SessionId id_;
    std::string frontend_id_;
    std::optional<Uid> uid_;
    Settings settings_;

    std::weak_ptr<Session> session_;
    SessionNotifier events_;
};

} // namespace session
