#pragma once
/**
 * @page pb-dispatcher Command Dispatcher
 * @file dispatcher.hpp
 * @brief Envelope → registry lookup → argument binding → encoder → device write.
 *
 * @details
 * PURPOSE
 * -------
 * The dispatcher is the glue between a parsed request and the device. It
 * owns no state besides a reference to the (immutable) registry, so a single
 * instance serves every client.
 *
 * OUTCOMES
 * --------
 * | situation                          | device write | result                                   |
 * |------------------------------------|--------------|------------------------------------------|
 * | name not registered                | none         | error "Unknown command"                  |
 * | bad arguments / encoder failed     | none         | error "<reason>"                         |
 * | write ok                           | exactly one  | success, command = name                  |
 * | write reported transport loss      | attempted    | DispatchStatus::TransportLost (no reply) |
 *
 * Transport loss is not turned into an error response here. It goes back to
 * the session loop, which reconnects and replays the same envelope.
 *
 * `encode()` is the synchronous first half (everything before the device) and
 * is what the one-shot CLI and the tests use to check requests without I/O.
 */

#include "pixelbridge/command_registry.hpp"
#include "pixelbridge/device_session.hpp"
#include "pixelbridge/envelope.hpp"

#include <functional>
#include <memory>
#include <string>

namespace pixelbridge {

struct CommandResult {
    bool        ok{false};
    std::string command;   // set on success
    std::string message;   // set on error

    static CommandResult success(const std::string& name) { return CommandResult{true, name, {}}; }
    static CommandResult error(const std::string& msg)    { return CommandResult{false, {}, msg}; }
};

/// `{"status":"success","command":...}` or `{"status":"error","message":...}`
std::string to_json(const CommandResult& r);

// WriteFailed: encoded fine, the device refused it; the result carries the reason.
enum class DispatchStatus : uint8_t { Done, WriteFailed, TransportLost };

class Dispatcher {
public:
    using Handler = std::function<void(DispatchStatus status, const CommandResult& result)>;

    explicit Dispatcher(const CommandRegistry& registry) : registry_(registry) {}

    /**
     * @brief Resolve, bind and encode without touching the device.
     * @return true with the payload in @p out; false with @p failure filled.
     */
    bool encode(const Envelope& env, Bytes& out, CommandResult& failure) const;

    /// Full dispatch. @p done runs on the event loop exactly once.
    void async_dispatch(const Envelope& env,
                        const std::shared_ptr<DeviceSession>& session,
                        Scheduler& scheduler,
                        Handler done) const;

private:
    const CommandRegistry& registry_;
};

} // namespace pixelbridge
