#pragma once
/**
 * @page pb-session-loop Session Loop
 * @file session_loop.hpp
 * @brief Per-client receive → parse → dispatch → respond cycle, plus the one-shot CLI run.
 *
 * @details
 * SERVER MODE (ClientSession)
 * ---------------------------
 * One ClientSession per accepted connection, each with its own DeviceSession.
 *
 * @code
 *   Acquiring ──unavailable──> send "Device unavailable", close ──> Finished
 *       │ connected
 *       v
 *   Receiving ──peer closed──> Finished
 *       │ message
 *       v
 *   Dispatching ──done──> send result ──> Receiving
 *       │ transport lost
 *       v
 *   Reconnecting(n) ──n > cap──> send "BLE connection lost", close ──> Finished
 *       │ reacquired
 *       └──> replay the same envelope (Dispatching)
 * @endcode
 *
 * - Strict ordering: the next receive is only issued after the reply to the
 *   previous message has been sent.
 * - Parse errors, unknown commands, bad arguments and anything thrown while
 *   handling a message become `{"status":"error",...}` replies; the loop goes on.
 * - Reconnects are counted per client and reset by every successful write, so
 *   a flaky link cannot spin forever; there is no recursion, each cycle is a
 *   fresh event-loop callback.
 * - Every exit path releases the DeviceSession and closes the channel.
 *
 * ONE-SHOT MODE (OneShot)
 * -----------------------
 * Acquire, dispatch one envelope, print one `status=...` line, release.
 * No reconnect.
 */

#include "pixelbridge/device_session.hpp"
#include "pixelbridge/dispatcher.hpp"
#include "pixelbridge/message_channel.hpp"
#include "pixelbridge/scheduler.hpp"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace pixelbridge {

enum class LoopState : uint8_t { Idle, Acquiring, Receiving, Dispatching, Reconnecting, Finished };

const char* to_string(LoopState s);

class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
    using FinishHandler = std::function<void(const std::string& reason)>;

    static std::shared_ptr<ClientSession> create(std::shared_ptr<MessageChannel> channel,
                                                 std::shared_ptr<DeviceSession> device,
                                                 const Dispatcher& dispatcher,
                                                 Scheduler& scheduler,
                                                 int max_recoveries = 3,
                                                 FinishHandler on_finish = {});

    void start();

    /// Stop at the next opportunity (server shutdown).
    void stop();

    LoopState state()      const { return state_; }
    int       recoveries() const { return recoveries_; }
    uint64_t  handled()    const { return handled_; }

private:
    ClientSession(std::shared_ptr<MessageChannel> channel, std::shared_ptr<DeviceSession> device,
                  const Dispatcher& dispatcher, Scheduler& scheduler, int max_recoveries,
                  FinishHandler on_finish);

    void receive_next();
    void handle_message(const std::string& text);
    void dispatch(const Envelope& env);
    void recover(const Envelope& env);
    void respond(const CommandResult& result);
    void respond_and_finish(const CommandResult& result, const std::string& reason);
    void finish(const std::string& reason);

    std::shared_ptr<MessageChannel> channel_;
    std::shared_ptr<DeviceSession>  device_;
    const Dispatcher&               dispatcher_;
    Scheduler&                      scheduler_;
    int                             max_recoveries_;
    FinishHandler                   on_finish_;

    LoopState state_{LoopState::Idle};
    int       recoveries_{0};   // consecutive transport-loss reconnects
    uint64_t  handled_{0};      // replies sent
};

class OneShot : public std::enable_shared_from_this<OneShot> {
public:
    /// Exit codes (see run()).
    static constexpr int EXIT_OK          = 0;
    static constexpr int EXIT_UNAVAILABLE = 1;
    static constexpr int EXIT_REJECTED    = 2;

    static std::shared_ptr<OneShot> create(std::shared_ptr<DeviceSession> device,
                                           const Dispatcher& dispatcher,
                                           Scheduler& scheduler,
                                           std::ostream& out,
                                           std::ostream& err);

    /// Start; @p done receives the process exit code.
    void run(const Envelope& env, std::function<void(int exit_code)> done);

private:
    OneShot(std::shared_ptr<DeviceSession> device, const Dispatcher& dispatcher,
            Scheduler& scheduler, std::ostream& out, std::ostream& err);

    std::shared_ptr<DeviceSession> device_;
    const Dispatcher&              dispatcher_;
    Scheduler&                     scheduler_;
    std::ostream&                  out_;
    std::ostream&                  err_;
};

} // namespace pixelbridge
