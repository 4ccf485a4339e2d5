#pragma once

#include <cstdint>

static constexpr uint64_t MAX_MESSAGE_SIZE = 64 * 1024; // 64KB

/*
    * Frame layout:
    * +------------------+---------------+-------------------+------------------------+
    * | Length (2 bytes) | Type (1 byte) | Reserved (1 byte) | Body (variable length) |
    * +------------------+---------------+-------------------+------------------------+
    *
    * Length: length of the JSON body in network byte order (excluding header)
    * Type: MessageType (REQUEST, RESPONSE, ERROR, NOTIFICATION, BATCH)
    * Body: UTF-8 JSON text
    *
    * for REQUEST:
    * {
    *   "command": "bind",
    *   "params": { "uid": 42 }
    * }
    *
    * for RESPONSE:
    * {
    *   "status": "ok",
    *   "command": "bind",
    *   "data": { ... }
    * }
    *
    * for ERROR:
    * {
    *   "status": "error",
    *   "errorCode": 2,
    *   "errorMessage": "session has already bound with 7"
    * }
    *
    * for BATCH: a JSON array of messages delivered in order.
*/

struct MessageHeader {
    uint16_t length; // Length of the message body
    uint8_t type;    // MessageType
    uint8_t reserved;

    MessageHeader() : length(0), type(0), reserved(0) {}

} __attribute__((packed));

static constexpr uint64_t MAX_BODY_SIZE = MAX_MESSAGE_SIZE - sizeof(MessageHeader);
