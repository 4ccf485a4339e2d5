#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace session {

enum class SessionErrc {
    SessionNotFound = 1,
    AlreadyBound = 2,
    NotBound = 3,
    SingleSessionViolation = 4,
    InvalidSettings = 5
};

inline const char* toString(SessionErrc code) {
    switch (code) {
        case SessionErrc::SessionNotFound: return "SessionNotFound";
        case SessionErrc::AlreadyBound: return "AlreadyBound";
        case SessionErrc::NotBound: return "NotBound";
        case SessionErrc::SingleSessionViolation: return "SingleSessionViolation";
        case SessionErrc::InvalidSettings: return "InvalidSettings";
    }
    return "Unknown";
}

class SessionError : public std::runtime_error {
protected:
    SessionErrc m_code;
    std::string m_formatted_what;

public:
    SessionError(SessionErrc code, const std::string& message)
        : std::runtime_error(message), m_code(code) {
        m_formatted_what = "[Session Error] " + message;
    }
    SessionErrc code() const noexcept { return m_code; }
    const char* what() const noexcept override {
        return m_formatted_what.c_str();
    }
};

// Completion callback: an empty optional means success.
using Callback = std::function<void(const std::optional<SessionError>&)>;

} // namespace session
