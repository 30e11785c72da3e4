#pragma once
/**
 * @page pb-device-session Device Session
 * @file device_session.hpp
 * @brief One logical BLE connection to the display: connect-with-retry, write, release.
 *
 * @details
 * PURPOSE
 * -------
 * DeviceSession is the only owner of a BleLink. Everything above it sees
 * three operations and two small result enums:
 *
 *   async_acquire(done)   → AcquireResult::Connected | Unavailable
 *   async_write(bytes)    → WriteResult::Ok | TransportLost
 *   release()             → always succeeds
 *
 * STATES
 * ------
 * @code
 *   Disconnected --acquire--> Connecting --ok--> Connected --write error--> Lost
 *        ^                        |                  |                       |
 *        +------ retries spent ---+---- release -----+------- release -------+
 * @endcode
 * At most one live link exists per session. A new acquisition always drops
 * whatever link was there before creating a fresh one.
 *
 * RETRY POLICY
 * ------------
 * This is the only place connect backoff lives. One connect per attempt; on
 * failure the attempt is logged, and after `retry_delay` the next one runs.
 * After `max_retries` consecutive failures the session reports Unavailable.
 * The delay is applied between attempts, not after the last one. Failures are
 * never thrown; they are only reported through the handler.
 *
 * THREADING
 * ---------
 * Single-threaded. All handlers run on the event loop behind the Scheduler.
 * Handlers are never invoked inline from the initiating call.
 */

#include "pixelbridge/ble_link.hpp"
#include "pixelbridge/encoders.hpp"
#include "pixelbridge/scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace pixelbridge {

/// The display's command characteristic.
constexpr const char* PIXEL_CHARACTERISTIC = "0000fa02-0000-1000-8000-00805f9b34fb";

struct RetryPolicy {
    int                       max_retries{5};
    std::chrono::milliseconds retry_delay{5000};
};

enum class SessionState  : uint8_t { Disconnected, Connecting, Connected, Lost };
enum class AcquireResult : uint8_t { Connected, Unavailable };
// Failed: the link is up but refused this write (e.g. characteristic missing).
// TransportLost: the link itself went away.
enum class WriteResult   : uint8_t { Ok, Failed, TransportLost };

const char* to_string(SessionState s);

class DeviceSession : public std::enable_shared_from_this<DeviceSession> {
public:
    using AcquireHandler = std::function<void(AcquireResult)>;
    using WriteHandler   = std::function<void(WriteResult, const std::string& reason)>;

    static std::shared_ptr<DeviceSession> create(std::string address,
                                                 LinkFactory factory,
                                                 Scheduler& scheduler,
                                                 RetryPolicy policy = {},
                                                 std::string characteristic = PIXEL_CHARACTERISTIC);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    void async_acquire(AcquireHandler done);
    void async_write(const Bytes& payload, WriteHandler done);

    /// Drop the link. Idempotent; disconnect errors are ignored.
    void release() noexcept;

    SessionState       state()   const { return state_; }
    const std::string& address() const { return address_; }
    const RetryPolicy& policy()  const { return policy_; }

    /// Connect attempts made by the most recent acquisition.
    int last_attempts() const { return attempts_; }

private:
    DeviceSession(std::string address, LinkFactory factory, Scheduler& scheduler,
                  RetryPolicy policy, std::string characteristic);

    void attempt(int n, uint64_t gen, AcquireHandler done);

    std::string             address_;
    LinkFactory             factory_;
    Scheduler&              scheduler_;
    RetryPolicy             policy_;
    std::string             characteristic_;

    std::shared_ptr<BleLink> link_;
    SessionState             state_{SessionState::Disconnected};
    int                      attempts_{0};
    uint64_t                 generation_{0};   // bumped by release(); stale handlers check it
};

} // namespace pixelbridge
