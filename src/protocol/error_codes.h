#ifndef ERROR_CODES_H
#define ERROR_CODES_H

// Error codes reported in ERROR frames. 1-5 mirror session::SessionErrc.
enum class ErrorCode {
    SUCCESS = 0,
    SESSION_NOT_FOUND = 1,
    ALREADY_BOUND = 2,
    NOT_BOUND = 3,
    SINGLE_SESSION_VIOLATION = 4,
    INVALID_SETTINGS = 5,
    BAD_REQUEST = 400,
    UNKNOWN_COMMAND = 404
};

#endif // ERROR_CODES_H
