#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "session/session_service.h"

namespace config {

struct ServerConfig {
    std::string host{"0.0.0.0"};
    uint16_t port{3010};
    std::string frontendId{"connector-server-1"};
    bool singleSession{false};
    // Max deferred callbacks run per loop turn, 0 = all that are ready.
    size_t tickBudget{0};
    int pollTimeoutMs{100};

    session::SessionServiceConfig sessionServiceConfig() const {
        return session::SessionServiceConfig{singleSession};
    }
};

// Missing keys keep their defaults. Throws ConfigError on unreadable files, bad JSON or wrong types.
ServerConfig parseServerConfig(const nlohmann::json& j);
ServerConfig loadServerConfig(const std::string& path);

} // namespace config
