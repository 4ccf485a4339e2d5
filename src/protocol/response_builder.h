#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace protocol {

using nlohmann::json;

class ResponseBuilder {
public:
    ResponseBuilder() = default;
    ~ResponseBuilder() = default;
    json buildSuccessResponse(const std::string& command, const json& data = json::object());
    json buildErrorResponse(int errorCode, const std::string& errorMessage);
    json buildClosedNotification(const json& session, const std::string& reason);
};

} // namespace protocol
