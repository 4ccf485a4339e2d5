#ifndef ENUMS_H
#define ENUMS_H

#include <cstdint>

enum class SessionState : uint8_t {
    INITED = 0,
    CLOSED = 1
};

enum class SessionEvent {
    BIND,
    UNBIND,
    CLOSED
};

enum class SocketEvent {
    CLOSING
};

enum class MessageType : uint8_t {
    REQUEST = 1,
    RESPONSE = 2,
    ERROR = 3,
    NOTIFICATION = 4,
    BATCH = 5
};

#endif // ENUMS_H
