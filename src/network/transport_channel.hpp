#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace crossbook::network {

/// Persistent duplex message channel used by the venue feed handlers
///
/// Ping/pong and framing stay below this interface: on_message only ever sees
/// complete text or binary payloads. on_closed fires exactly once per open(),
/// whether the peer ended the stream, an I/O error occurred or close() was called.
class TransportChannel {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(std::string_view)> on_message;
        std::function<void(std::string_view reason)> on_closed;
    };

    virtual ~TransportChannel() = default;

    /// Start connecting; handlers are invoked from the owning io_context
    virtual void open(Handlers handlers) = 0;

    /// Queue one message for sending; ignored unless open
    virtual void send(std::string message) = 0;

    /// Close the channel and drop the handlers after on_closed
    virtual void close() = 0;

    /// Human readable peer description for logs
    [[nodiscard]] virtual std::string describe() const = 0;
};

}  // namespace crossbook::network
