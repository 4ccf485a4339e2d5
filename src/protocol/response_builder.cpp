#include "response_builder.h"
#include <string>

namespace protocol {

json ResponseBuilder::buildSuccessResponse(const std::string& command, const json& data) {
    json resp = {
        {"status", "ok"},
        {"command", command},
        {"data", data}
    };
    return resp;
}

json ResponseBuilder::buildErrorResponse(int errorCode, const std::string& errorMessage) {
    json resp = {
        {"status", "error"},
        {"errorCode", errorCode},
        {"errorMessage", errorMessage}
    };
    return resp;
}

json ResponseBuilder::buildClosedNotification(const json& session, const std::string& reason) {
    json resp = {
        {"event", "closed"},
        {"reason", reason},
        {"session", session}
    };
    return resp;
}

} // namespace protocol
