#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "concurrency/notifier.h"
#include "types/enums.h"
#include "types/session_types.h"

namespace net {

// Transport connection handle held by a Session.
class ISocket {
public:
    using Ptr = std::shared_ptr<ISocket>;
    using Notifier = concurrency::Notifier<SocketEvent, const std::string&>;

    virtual ~ISocket() = default;
    virtual void send(const nlohmann::json& msg) = 0;
    virtual void sendBatch(const std::vector<nlohmann::json>& msgs) = 0;
    virtual void disconnect() = 0;
    virtual std::optional<RemoteAddress> remoteAddress() const = 0;

    // "closing" is emitted with the close reason before disconnect() is scheduled.
    Notifier& events() { return events_; }

private:
    Notifier events_;
};

};  // namespace net
