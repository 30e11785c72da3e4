#pragma once
/**
 * @file message_channel.hpp
 * @brief One client's request/response message pipe.
 *
 * Contract:
 *  - async_receive() delivers one whole message, or Closed when the peer has
 *    gone (clean close or dropped connection). Error is any other failure.
 *  - async_send() sends one whole message.
 *  - at most one receive and one send in flight at a time.
 *  - close() is best-effort and idempotent.
 *
 * The session loop only talks to this interface; WebSocketChannel is the
 * production implementation, tests use a scripted fake.
 */

#include <cstdint>
#include <functional>
#include <string>

namespace pixelbridge {

enum class ChannelStatus : uint8_t { Ok = 0, Closed = 1, Error = 2 };

class MessageChannel {
public:
    using ReceiveHandler = std::function<void(ChannelStatus status, std::string message)>;
    using SendHandler    = std::function<void(ChannelStatus status)>;

    virtual ~MessageChannel() = default;

    virtual void async_receive(ReceiveHandler done) = 0;
    virtual void async_send(std::string message, SendHandler done) = 0;
    virtual void close() noexcept = 0;

    /// "ip:port" or similar, for logs.
    virtual std::string peer() const = 0;
};

} // namespace pixelbridge
