#pragma once

#include <string>
#include <unordered_map>

namespace protocol {

enum class CommandType {
    BIND,
    UNBIND,
    SET,
    GET,
    PUSH,
    PUSH_ALL,
    EXPORT,
    KICK,
    KICK_SESSION,
    COUNT,
    ADDRESS,
    INVALID
};

inline CommandType stringToCommandType(const std::string& command_str) {
    static const std::unordered_map<std::string, CommandType> command_map = {
        {"bind", CommandType::BIND},
        {"unbind", CommandType::UNBIND},
        {"set", CommandType::SET},
        {"get", CommandType::GET},
        {"push", CommandType::PUSH},
        {"pushAll", CommandType::PUSH_ALL},
        {"export", CommandType::EXPORT},
        {"kick", CommandType::KICK},
        {"kickSession", CommandType::KICK_SESSION},
        {"count", CommandType::COUNT},
        {"address", CommandType::ADDRESS}
    };

    auto it = command_map.find(command_str);
    return (it != command_map.end()) ? it->second : CommandType::INVALID;
}

} // namespace protocol
