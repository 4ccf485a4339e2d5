#pragma once

#include <stdexcept>
#include <string>

namespace config {

class ConfigError : public std::runtime_error {
protected:
    std::string m_formatted_what;

public:
    ConfigError(const std::string& message)
        : std::runtime_error(message) {
        m_formatted_what = "[Config Error] " + message;
    }
    const char* what() const noexcept override {
        return m_formatted_what.c_str();
    }
};

} // namespace config
