#pragma once
/**
 * @file scheduler.hpp
 * @brief Deferred work and delays for the single-threaded event loop.
 *
 * DeviceSession never sleeps. It asks a Scheduler to run the next step later
 * (backoff between connect attempts) or "soon" (completing an operation
 * without re-entering the caller's stack). Production uses the io_context;
 * tests substitute a fake clock that records every requested delay.
 */

#include <chrono>
#include <functional>

#include <boost/asio/io_context.hpp>

namespace pixelbridge {

class Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    /// Run @p task on the loop after the current handler returns.
    virtual void post(Task task) = 0;

    /// Run @p task once @p delay has elapsed. Never blocks.
    virtual void async_wait(std::chrono::milliseconds delay, Task task) = 0;
};

class AsioScheduler : public Scheduler {
public:
    explicit AsioScheduler(boost::asio::io_context& io) : io_(io) {}

    void post(Task task) override;
    void async_wait(std::chrono::milliseconds delay, Task task) override;

private:
    boost::asio::io_context& io_;
};

} // namespace pixelbridge
