#include "session.h"

#include "common/debug.h"
#include "frontend_session.h"
#include "session_service.h"

namespace session {

Session::Session(SessionId sid, const std::string& frontendId, net::ISocket::Ptr socket,
                 SessionService* service, concurrency::TickQueue& ticks)
    : id_(sid), frontend_id_(frontendId), settings_(Settings::object()),
      socket_(std::move(socket)), service_(service), ticks_(ticks) {
    if (!socket_) {
        error_cpp20("Session " + std::to_string(sid) + " created without a socket");
    }
}

std::shared_ptr<FrontendSession> Session::toFrontendSession() {
    return std::make_shared<FrontendSession>(*this);
}

void Session::bind(Uid uid) {
    uid_ = uid;
    events_.emit(SessionEvent::BIND, SessionEventArgs{uid, nullptr, {}});
}

void Session::unbind(Uid uid) {
    uid_.reset();
    events_.emit(SessionEvent::UNBIND, SessionEventArgs{uid, nullptr, {}});
}

void Session::set(const std::string& key, const SettingValue& value) {
    settings_[key] = value;
}

void Session::set(const Settings& values) {
    if (!values.is_object()) {
        error_cpp20("Session " + std::to_string(id_) + ": settings must be an object, got " + values.type_name());
        return;
    }
    for (auto& [key, value] : values.items()) {
        settings_[key] = value;
    }
}

std::optional<SettingValue> Session::get(const std::string& key) const {
    auto it = settings_.find(key);
    if (it == settings_.end()) return std::nullopt;
    return *it;
}

void Session::remove(const std::string& key) {
    settings_.erase(key);
}

void Session::send(const nlohmann::json& msg) {
    if (socket_) socket_->send(msg);
}

void Session::sendBatch(const std::vector<nlohmann::json>& msgs) {
    if (socket_) socket_->sendBatch(msgs);
}

void Session::closed(const std::string& reason) {
    log_cpp20("session on [" + frontend_id_ + "] is closed with session id: " + std::to_string(id_));
    if (state_ == SessionState::CLOSED) {
        return;
    }
    state_ = SessionState::CLOSED;
    // the registry may hold the last owning reference
    auto self = weak_from_this().lock();
    if (service_) {
        service_->remove(id_);
    }
    events_.emit(SessionEvent::CLOSED, SessionEventArgs{uid_, toFrontendSession(), reason});
    if (!socket_) return;
    socket_->events().emit(SocketEvent::CLOSING, reason);
    ticks_.post([socket = socket_]() {
        socket->disconnect();
    });
}

std::optional<RemoteAddress> Session::remoteAddress() const {
    if (!socket_) return std::nullopt;
    return socket_->remoteAddress();
}

} // namespace session
