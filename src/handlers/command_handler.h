#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "protocol/request_parser.h"
#include "protocol/response_builder.h"
#include "session/frontend_session.h"
#include "session/session_error.h"
#include "session/session_service.h"
#include "types/enums.h"

namespace handlers {

using json = nlohmann::json;
using protocol::RequestParser;
using protocol::ResponseBuilder;

/*
    * Per-connection application handler. It only sees the connection through a
    * FrontendSession and replies through the responder, never through the transport.
    *
    * bind        {"uid": 42}
    * unbind      {"uid": 42}
    * set         {"key": "score", "value": 10}   local snapshot only
    * get         {"key": "score"}
    * push        {"key": "score"}                 write back into the Session
    * pushAll     {}
    * export      {}
    * kick        {"uid": 42, "reason": "admin"}
    * kickSession {"sid": 3, "reason": "admin"}
    * count       {}
    * address     {"sid": 3}                       defaults to this connection
*/
class CommandHandler {
public:
    using Ptr = std::shared_ptr<CommandHandler>;
    using Responder = std::function<void(MessageType, const json&)>;

    CommandHandler(session::SessionService& service, session::FrontendSession::Ptr frontend, Responder responder);

    CommandHandler(const CommandHandler&) = delete;
    CommandHandler& operator=(const CommandHandler&) = delete;

    void handle(const json& request);

    const session::FrontendSession::Ptr& frontendSession() const { return frontend_; }

private:
    void handleBind(const json& params);
    void handleUnbind(const json& params);
    void handleSet(const json& params);
    void handleGet(const json& params);
    void handlePush(const json& params);
    void handlePushAll();
    void handleKick(const json& params);
    void handleKickSession(const json& params);
    void handleAddress(const json& params);

    void onSuccess(const std::string& command, const json& data = json::object());
    void onFailed(int error_code, const std::string& error_message);
    // Completion callback that answers with ok/error once the service reports back.
    session::Callback replyWith(const std::string& command, json data = json::object());
    void subscribeClosed();

    session::SessionService& service_;
    session::FrontendSession::Ptr frontend_{nullptr};
    Responder responder_;

    RequestParser requestParser;
    ResponseBuilder responseBuilder;
    bool closed_subscribed_{false};
};

} // namespace handlers
