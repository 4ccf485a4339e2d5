#include "request_parser.h"
#include <string>

namespace protocol {


std::optional<json> RequestParser::parse(const std::string& request) {
    auto j = json::parse(request, nullptr, false);
    if (j.is_discarded()) {
        reset();
        return std::nullopt;
    }
    return parse(j);
}

std::optional<json> RequestParser::parse(const json& request) {
    reset();
    if (!request.is_object()) {
        return std::nullopt;
    }
    if (request.contains("command") && request["command"].is_string()) {
        command = request["command"].get<std::string>();
    } else {
        return std::nullopt;
    }

    if (request.contains("params")) {
        if (!request["params"].is_object()) {
            return std::nullopt;
        }
        parameters = request["params"];
    }
    return request;
}

} // namespace protocol
