#include "server_config.h"

#include <fstream>
#include <limits>

#include "common/debug.h"
#include "config_error.h"

namespace config {

namespace {

template <typename T>
void readField(const nlohmann::json& j, const char* name, T& out) {
    auto it = j.find(name);
    if (it == j.end()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid value for \"") + name + "\": " + e.what());
    }
}

} // namespace

ServerConfig parseServerConfig(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be an object");
    }
    ServerConfig cfg;
    readField(j, "host", cfg.host);
    readField(j, "frontendId", cfg.frontendId);
    readField(j, "singleSession", cfg.singleSession);
    readField(j, "tickBudget", cfg.tickBudget);
    readField(j, "pollTimeoutMs", cfg.pollTimeoutMs);

    int port = cfg.port;
    readField(j, "port", port);
    if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
        throw ConfigError("port out of range: " + std::to_string(port));
    }
    cfg.port = static_cast<uint16_t>(port);

    if (cfg.frontendId.empty()) {
        throw ConfigError("frontendId must not be empty");
    }
    return cfg;
}

ServerConfig loadServerConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file: " + path);
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigError("malformed JSON in config file: " + path);
    }
    auto cfg = parseServerConfig(j);
    log_cpp20("[Config] loaded " + path + " frontendId=" + cfg.frontendId);
    return cfg;
}

} // namespace config
