#include "pixelbridge/scheduler.hpp"

#include <memory>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace pixelbridge {

void AsioScheduler::post(Task task) {
    boost::asio::post(io_, std::move(task));
}

void AsioScheduler::async_wait(std::chrono::milliseconds delay, Task task) {
    // timer lives until its handler runs
    auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
    timer->async_wait([timer, task = std::move(task)](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        task();
    });
}

} // namespace pixelbridge
