#include "frontend_session.h"

#include "common/debug.h"
#include "session_service.h"

namespace session {

FrontendSession::FrontendSession(Session& session)
    : id_(session.id()), frontend_id_(session.frontendId()), uid_(session.uid()),
      settings_(session.settings()), session_(session.weak_from_this()) {}

SessionService* FrontendSession::liveService() const {
    auto session = session_.lock();
    return session ? session->service() : nullptr;
}

SessionError FrontendSession::detachedError() const {
    error_cpp20("FrontendSession " + std::to_string(id_) + ": session is gone or detached from its service");
    return SessionError(SessionErrc::SessionNotFound, "session does not exist, sid: " + std::to_string(id_));
}

void FrontendSession::bind(Uid uid, Callback cb) {
    auto* service = liveService();
    if (!service) {
        if (cb) cb(detachedError());
        return;
    }
    std::weak_ptr<FrontendSession> weak = weak_from_this();
    service->bind(id_, uid, [weak, uid, cb = std::move(cb)](const std::optional<SessionError>& err) {
        if (!err) {
            if (auto self = weak.lock()) self->uid_ = uid;
        }
        if (cb) cb(err);
    });
}

void FrontendSession::unbind(Uid uid, Callback cb) {
    auto* service = liveService();
    if (!service) {
        if (cb) cb(detachedError());
        return;
    }
    std::weak_ptr<FrontendSession> weak = weak_from_this();
    service->unbind(id_, uid, [weak, cb = std::move(cb)](const std::optional<SessionError>& err) {
        if (!err) {
            if (auto self = weak.lock()) self->uid_.reset();
        }
        if (cb) cb(err);
    });
}

void FrontendSession::set(const std::string& key, const SettingValue& value) {
    settings_[key] = value;
}

std::optional<SettingValue> FrontendSession::get(const std::string& key) const {
    auto it = settings_.find(key);
    if (it == settings_.end()) return std::nullopt;
    return *it;
}

void FrontendSession::remove(const std::string& key) {
    settings_.erase(key);
}

void FrontendSession::push(const std::string& key, Callback cb) {
    auto* service = liveService();
    if (!service) {
        if (cb) cb(detachedError());
        return;
    }
    service->import(id_, key, get(key).value_or(SettingValue()), std::move(cb));
}

void FrontendSession::pushAll(Callback cb) {
    auto* service = liveService();
    if (!service) {
        if (cb) cb(detachedError());
        return;
    }
    service->importAll(id_, settings_, std::move(cb));
}

void FrontendSession::on(SessionEvent event, SessionNotifier::Listener listener) {
    events_.subscribe(event, listener);
    if (auto session = session_.lock()) {
        session->events().subscribe(event, std::move(listener));
    }
}

nlohmann::json FrontendSession::exportSession() const {
    return nlohmann::json{
        {"id", id_},
        {"frontendId", frontend_id_},
        {"uid", uid_ ? nlohmann::json(*uid_) : nlohmann::json(nullptr)},
        {"settings", settings_}
    };
}

} // namespace session
