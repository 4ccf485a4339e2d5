#include "command_handler.h"

#include "common/debug.h"
#include "protocol/commands.h"
#include "protocol/error_codes.h"

namespace handlers {

namespace {

std::optional<uint64_t> readId(const json& params, const char* name) {
    auto it = params.find(name);
    // parsed JSON yields unsigned numbers, in-process literals signed ones
    if (it == params.end() || !it->is_number_integer()) return std::nullopt;
    if (!it->is_number_unsigned() && it->get<int64_t>() < 0) return std::nullopt;
    return it->get<uint64_t>();
}

std::optional<std::string> readKey(const json& params) {
    auto it = params.find("key");
    if (it == params.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::string readReason(const json& params) {
    auto it = params.find("reason");
    if (it == params.end() || !it->is_string()) return session::SessionService::DEFAULT_KICK_REASON;
    return it->get<std::string>();
}

} // namespace

CommandHandler::CommandHandler(session::SessionService& service, session::FrontendSession::Ptr frontend, Responder responder)
    : service_(service), frontend_(std::move(frontend)), responder_(std::move(responder)) {
    log_cpp20("[CommandHandler] constructed for sid=" + (frontend_ ? std::to_string(frontend_->id()) : std::string("-1")));
}

void CommandHandler::handle(const json& request) {
    if (!requestParser.parse(request)) {
        onFailed(static_cast<int>(ErrorCode::BAD_REQUEST), "malformed request");
        return;
    }
    const auto& params = requestParser.getParameters();
    switch (requestParser.getCommandType()) {
        case protocol::CommandType::BIND: handleBind(params); break;
        case protocol::CommandType::UNBIND: handleUnbind(params); break;
        case protocol::CommandType::SET: handleSet(params); break;
        case protocol::CommandType::GET: handleGet(params); break;
        case protocol::CommandType::PUSH: handlePush(params); break;
        case protocol::CommandType::PUSH_ALL: handlePushAll(); break;
        case protocol::CommandType::EXPORT:
            onSuccess("export", frontend_->exportSession());
            break;
        case protocol::CommandType::KICK: handleKick(params); break;
        case protocol::CommandType::KICK_SESSION: handleKickSession(params); break;
        case protocol::CommandType::COUNT:
            onSuccess("count", {{"count", service_.getSessionsCount()}});
            break;
        case protocol::CommandType::ADDRESS: handleAddress(params); break;
        case protocol::CommandType::INVALID:
            onFailed(static_cast<int>(ErrorCode::UNKNOWN_COMMAND), "unknown command: " + requestParser.getCommand());
            break;
    }
}

void CommandHandler::handleBind(const json& params) {
    auto uid = readId(params, "uid");
    if (!uid) {
        onFailed(static_cast<int>(ErrorCode::BAD_REQUEST), "missing uid");
        return;
    }
    subscribeClosed();
    frontend_->bind(*uid, replyWith("bind", {{"uid", *uid}}));
}

void CommandHandler::handleUnbind(const json& params) {
    auto uid = readId(params, "uid");
    if (!uid) {
        onFailed(static_cast<int>(ErrorCode::BAD_REQUEST), "missing uid");
        return;
    }
    frontend_->unbind(*uid, replyWith("unbind", {{"uid", *uid}}));
}

void CommandHandler::handleSet(const json& params) {
    auto key = readKey(params);
    if (!key || !params.contains("value")) {
        onFailed(static_cast<int>(ErrorCode::BAD_REQUEST), "missing key or value");
        return;
    }
    frontend_->set(*key, params["value"]);
    onSuccess("set", {{"key", *key}});
}

void CommandHandler::handleGet(const json& params) {
    auto key = readKey(params);
    if (!key) {
        onFailed(static_cast<int>(ErrorCode::BAD_REQUEST), "missing key");
        return;
    }
    onSuccess("get", {{"key", *key}, {"value", frontend_->get(*key).value_or(json())}});
}

void CommandHandler::handlePush(const json& params) {
    auto key = readKey(params);
    if (!key) {
        onFailed(static_cast<int>(ErrorCode::BAD_REQUEST), "missing key");
        return;
    }
    frontend_->push(*key, replyWith("push", {{"key", *key}}));
}

void CommandHandler::handlePushAll() {
    frontend_->pushAll(replyWith("pushAll"));
}

void CommandHandler::handleKick(const json& params) {
    auto uid = readId(params, "uid");
    if (!uid) {
        onFailed(static_cast<int>(ErrorCode::BAD_REQUEST), "missing uid");
        return;
    }
    service_.kick(*uid, readReason(params), replyWith("kick", {{"uid", *uid}}));
}

void CommandHandler::handleKickSession(const json& params) {
    auto sid = readId(params, "sid");
    if (!sid) {
        onFailed(static_cast<int>(ErrorCode::BAD_REQUEST), "missing sid");
        return;
    }
    service_.kickBySessionId(*sid, readReason(params), replyWith("kickSession", {{"sid", *sid}}));
}

void CommandHandler::handleAddress(const json& params) {
    SessionId sid = readId(params, "sid").value_or(frontend_->id());
    auto addr = service_.getClientAddressBySessionId(sid);
    json data = {{"sid", sid}, {"address", nullptr}};
    if (addr) {
        data["address"] = {{"ip", addr->ip}, {"port", addr->port}};
    }
    onSuccess("address", data);
}

void CommandHandler::onSuccess(const std::string& command, const json& data) {
    responder_(MessageType::RESPONSE, responseBuilder.buildSuccessResponse(command, data));
}

void CommandHandler::onFailed(int error_code, const std::string& error_message) {
    log_cpp20("[CommandHandler] request failed: " + error_message);
    responder_(MessageType::ERROR, responseBuilder.buildErrorResponse(error_code, error_message));
}

session::Callback CommandHandler::replyWith(const std::string& command, json data) {
    // may run after this handler is gone
    return [responder = responder_, command, data = std::move(data)](const std::optional<session::SessionError>& err) {
        ResponseBuilder builder;
        if (err) {
            responder(MessageType::ERROR, builder.buildErrorResponse(static_cast<int>(err->code()), err->what()));
            return;
        }
        responder(MessageType::RESPONSE, builder.buildSuccessResponse(command, data));
    };
}

void CommandHandler::subscribeClosed() {
    if (closed_subscribed_) return;
    closed_subscribed_ = true;
    frontend_->on(SessionEvent::CLOSED, [responder = responder_](const session::SessionEventArgs& args) {
        ResponseBuilder builder;
        json snapshot = args.session ? args.session->exportSession() : json(nullptr);
        responder(MessageType::NOTIFICATION, builder.buildClosedNotification(snapshot, args.reason));
    });
}

} // namespace handlers
