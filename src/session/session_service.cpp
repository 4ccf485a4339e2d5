#include "session_service.h"
#include <algorithm>

#include "common/debug.h"

namespace session {

namespace {

SessionError notFound(SessionId sid) {
    return SessionError(SessionErrc::SessionNotFound, "session does not exist, sid: " + std::to_string(sid));
}

} // namespace

SessionService::SessionService(concurrency::TickQueue& ticks, SessionServiceConfig config)
    : ticks_(ticks), config_(config) {}

SessionService::~SessionService() {
    for (auto& [sid, session] : sessions_) {
        session->detachService();
    }
}

Session::Ptr SessionService::create(SessionId sid, const std::string& frontendId, net::ISocket::Ptr socket) {
    auto session = std::make_shared<Session>(sid, frontendId, std::move(socket), this, ticks_);
    if (auto previous = get(sid)) {
        error_cpp20("[SessionService] duplicate sid=" + std::to_string(sid) + ", replacing registry entry");
        remove(sid);
        previous->detachService();
    }
    sessions_[sid] = session;
    log_cpp20("[SessionService] create session sid=" + std::to_string(sid) + " frontend=" + frontendId);
    return session;
}

void SessionService::bind(SessionId sid, Uid uid, Callback cb) {
    auto session = get(sid);
    if (!session) {
        defer(std::move(cb), notFound(sid));
        return;
    }

    if (session->uid()) {
        if (*session->uid() == uid) {
            // already bound with the same uid
            defer(std::move(cb));
            return;
        }
        defer(std::move(cb), SessionError(SessionErrc::AlreadyBound,
            "session has already bound with " + std::to_string(*session->uid())));
        return;
    }

    auto it = uid_map_.find(uid);
    if (config_.singleSession && it != uid_map_.end() && !it->second.empty()) {
        defer(std::move(cb), SessionError(SessionErrc::SingleSessionViolation,
            "singleSession is enabled, and session has already bound with uid: " + std::to_string(uid)));
        return;
    }

    auto& bucket = uid_map_[uid];
    if (std::find(bucket.begin(), bucket.end(), session) != bucket.end()) {
        defer(std::move(cb));
        return;
    }
    bucket.push_back(session);
    session->bind(uid);
    log_cpp20("[SessionService] bind sid=" + std::to_string(sid) + " uid=" + std::to_string(uid));

    defer(std::move(cb));
}

void SessionService::unbind(SessionId sid, Uid uid, Callback cb) {
    auto session = get(sid);
    if (!session) {
        defer(std::move(cb), notFound(sid));
        return;
    }

    if (!session->uid() || *session->uid() != uid) {
        std::string current = session->uid() ? std::to_string(*session->uid()) : std::string("null");
        defer(std::move(cb), SessionError(SessionErrc::NotBound, "session has not bind with " + current));
        return;
    }

    if (auto it = uid_map_.find(uid); it != uid_map_.end()) {
        auto& bucket = it->second;
        bucket.erase(std::remove(bucket.begin(), bucket.end(), session), bucket.end());
        if (bucket.empty()) {
            uid_map_.erase(it);
        }
    }
    session->unbind(uid);
    log_cpp20("[SessionService] unbind sid=" + std::to_string(sid) + " uid=" + std::to_string(uid));

    defer(std::move(cb));
}

Session::Ptr SessionService::get(SessionId sid) const {
    auto it = sessions_.find(sid);
    return it == sessions_.end() ? nullptr : it->second;
}

std::optional<std::vector<Session::Ptr>> SessionService::getByUid(Uid uid) const {
    auto it = uid_map_.find(uid);
    if (it == uid_map_.end()) return std::nullopt;
    return it->second;
}

void SessionService::remove(SessionId sid) {
    auto it = sessions_.find(sid);
    if (it == sessions_.end()) return;
    auto session = it->second;
    sessions_.erase(it);

    log_cpp20("[SessionService] remove session sid=" + std::to_string(sid));
    if (!session->uid()) return;
    auto uit = uid_map_.find(*session->uid());
    if (uit == uid_map_.end()) return;
    auto& bucket = uit->second;
    auto pos = std::find(bucket.begin(), bucket.end(), session);
    if (pos != bucket.end()) {
        bucket.erase(pos);
        if (bucket.empty()) {
            uid_map_.erase(uit);
        }
    }
}

void SessionService::import(SessionId sid, const std::string& key, const SettingValue& value, Callback cb) {
    auto session = get(sid);
    if (!session) {
        if (cb) cb(notFound(sid));
        return;
    }
    session->set(key, value);
    if (cb) cb(std::nullopt);
}

void SessionService::importAll(SessionId sid, const Settings& settings, Callback cb) {
    auto session = get(sid);
    if (!session) {
        if (cb) cb(notFound(sid));
        return;
    }
    if (!settings.is_object()) {
        if (cb) cb(SessionError(SessionErrc::InvalidSettings,
            "settings must be a key/value object, got " + std::string(settings.type_name())));
        return;
    }
    session->set(settings);
    if (cb) cb(std::nullopt);
}

void SessionService::kick(Uid uid, const std::string& reason, Callback cb) {
    if (auto it = uid_map_.find(uid); it != uid_map_.end()) {
        std::vector<SessionId> sids;
        sids.reserve(it->second.size());
        for (const auto& s : it->second) {
            sids.push_back(s->id());
        }
        log_cpp20("[SessionService] kick uid=" + std::to_string(uid) + " sessions=" + std::to_string(sids.size()));
        for (auto sid : sids) {
            // a closed listener may already have removed it
            if (auto session = get(sid)) {
                session->closed(reason);
            }
        }
    }
    defer(std::move(cb));
}

void SessionService::kick(Uid uid, Callback cb) {
    kick(uid, DEFAULT_KICK_REASON, std::move(cb));
}

void SessionService::kickBySessionId(SessionId sid, const std::string& reason, Callback cb) {
    if (auto session = get(sid)) {
        log_cpp20("[SessionService] kick sid=" + std::to_string(sid));
        session->closed(reason);
    }
    defer(std::move(cb));
}

void SessionService::kickBySessionId(SessionId sid, Callback cb) {
    kickBySessionId(sid, DEFAULT_KICK_REASON, std::move(cb));
}

std::optional<RemoteAddress> SessionService::getClientAddressBySessionId(SessionId sid) const {
    auto session = get(sid);
    if (!session) return std::nullopt;
    return session->remoteAddress();
}

bool SessionService::sendMessage(SessionId sid, const nlohmann::json& msg) {
    auto session = get(sid);
    if (!session) {
        log_cpp20("Fail to send message for non-existing session, sid: " + std::to_string(sid) + " msg: " + msg.dump());
        return false;
    }
    session->send(msg);
    return true;
}

bool SessionService::sendMessageByUid(Uid uid, const nlohmann::json& msg) {
    auto sessions = getByUid(uid);
    if (!sessions) {
        log_cpp20("fail to send message by uid for non-existing session. uid: " + std::to_string(uid));
        return false;
    }
    for (const auto& session : *sessions) {
        session->send(msg);
    }
    return true;
}

void SessionService::forEachSession(const SessionVisitor& fn) const {
    std::vector<Session::Ptr> snapshot;
    snapshot.reserve(sessions_.size());
    for (const auto& [sid, session] : sessions_) {
        snapshot.push_back(session);
    }
    for (const auto& session : snapshot) {
        fn(session);
    }
}

void SessionService::forEachBindedSession(const SessionVisitor& fn) const {
    std::vector<Session::Ptr> snapshot;
    for (const auto& [uid, bucket] : uid_map_) {
        snapshot.insert(snapshot.end(), bucket.begin(), bucket.end());
    }
    for (const auto& session : snapshot) {
        fn(session);
    }
}

void SessionService::defer(Callback cb, std::optional<SessionError> err) {
    if (!cb) return;
    ticks_.post([cb = std::move(cb), err = std::move(err)]() {
        cb(err);
    });
}

} // namespace session
