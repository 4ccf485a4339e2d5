#pragma once

#include <string>
#include <optional>
#include "commands.h"
#include <nlohmann/json.hpp>

namespace protocol {

using nlohmann::json;

// Validates {"command": <string>, "params": <object, optional>}.
class RequestParser {
public:
    RequestParser() = default;
    ~RequestParser() = default;
    std::optional<json> parse(const std::string& request);
    std::optional<json> parse(const json& request);

    const std::string& getCommand() const {
        return command;
    }

    CommandType getCommandType() const {
        return stringToCommandType(command);
    }

    const json& getParameters() const {
        return parameters;
    }

private:
    inline void reset() {
        command.clear();
        parameters = json::object();
    }

    std::string command;
    json parameters = json::object();
};

} // namespace protocol
