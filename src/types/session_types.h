#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

using SessionId = uint64_t;
using Uid = uint64_t;

// Settings values are a tagged variant: string, number, boolean, object, array or null.
using SettingValue = nlohmann::json;
// Always a JSON object keyed by setting name.
using Settings = nlohmann::json;

struct RemoteAddress {
    std::string ip;
    uint16_t port{0};

    bool operator==(const RemoteAddress&) const = default;
};
