#pragma once
// Test doubles for the async seams: BLE link, scheduler clock, client channel.
// Everything completes through the test's io_context so ordering matches the
// real event loop.

#include "pixelbridge/ble_link.hpp"
#include "pixelbridge/encoders.hpp"
#include "pixelbridge/message_channel.hpp"
#include "pixelbridge/scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

namespace pixelbridge {
namespace testing {

// Fake clock: delays are recorded and "elapse" instantly.
class FakeScheduler : public Scheduler {
public:
    explicit FakeScheduler(boost::asio::io_context& io) : io_(io) {}

    void post(Task task) override { boost::asio::post(io_, std::move(task)); }

    void async_wait(std::chrono::milliseconds delay, Task task) override {
        delays.push_back(delay);
        now += delay;
        boost::asio::post(io_, std::move(task));
    }

    std::vector<std::chrono::milliseconds> delays;
    std::chrono::milliseconds now{0};

private:
    boost::asio::io_context& io_;
};

struct WriteRecord {
    std::string characteristic;
    Bytes       data;
    LinkStatus  status;
};

// The physical display, as seen through every link the factory hands out.
class FakeDevice {
public:
    explicit FakeDevice(boost::asio::io_context& io) : io(io) {}

    LinkFactory factory();

    std::size_t ok_writes() const {
        return (std::size_t)std::count_if(writes.begin(), writes.end(),
            [](const WriteRecord& w) { return w.status == LinkStatus::Ok; });
    }

    boost::asio::io_context& io;

    std::deque<bool>       connect_script;          // consumed first
    bool                   connect_default{true};
    std::deque<LinkStatus> write_script;
    LinkStatus             write_default{LinkStatus::Ok};
    bool                   drop_after_next_write{false};

    int connect_attempts{0};
    int disconnects{0};
    int live{0};
    int max_live{0};
    std::vector<WriteRecord> writes;
};

class FakeLink : public BleLink, public std::enable_shared_from_this<FakeLink> {
public:
    explicit FakeLink(FakeDevice& dev) : dev_(dev) {}

    void async_connect(ConnectHandler done) override {
        ++dev_.connect_attempts;
        bool ok = dev_.connect_default;
        if (!dev_.connect_script.empty()) {
            ok = dev_.connect_script.front();
            dev_.connect_script.pop_front();
        }
        auto self = shared_from_this();
        boost::asio::post(dev_.io, [self, ok, done] {
            if (ok) {
                self->connected_ = true;
                self->counted_ = true;
                ++self->dev_.live;
                self->dev_.max_live = std::max(self->dev_.max_live, self->dev_.live);
            }
            done(ok, ok ? "" : "scripted connect failure");
        });
    }

    void async_write(const std::string& uuid, const std::vector<uint8_t>& data,
                     WriteHandler done) override {
        LinkStatus st = dev_.write_default;
        if (!dev_.write_script.empty()) {
            st = dev_.write_script.front();
            dev_.write_script.pop_front();
        }
        dev_.writes.push_back(WriteRecord{uuid, data, st});
        if (st == LinkStatus::Lost) connected_ = false;
        if (st == LinkStatus::Ok && dev_.drop_after_next_write) {
            dev_.drop_after_next_write = false;
            connected_ = false;                  // peer vanishes after this one
        }
        boost::asio::post(dev_.io, [done, st] {
            switch (st) {
            case LinkStatus::Ok:     done(st, ""); break;
            case LinkStatus::Failed: done(st, "characteristic_not_found"); break;
            case LinkStatus::Lost:   done(st, "scripted link loss"); break;
            }
        });
    }

    void disconnect() noexcept override {
        ++dev_.disconnects;
        connected_ = false;
        if (counted_) {
            counted_ = false;
            --dev_.live;
        }
    }

    bool is_connected() const override { return connected_; }
    const char* name() const override { return "fake"; }

private:
    FakeDevice& dev_;
    bool connected_{false};
    bool counted_{false};
};

inline LinkFactory FakeDevice::factory() {
    return [this](const std::string&) -> std::shared_ptr<BleLink> {
        return std::make_shared<FakeLink>(*this);
    };
}

// Client side: scripted inbound messages, then the peer closes.
class FakeChannel : public MessageChannel, public std::enable_shared_from_this<FakeChannel> {
public:
    FakeChannel(boost::asio::io_context& io, std::vector<std::string> inbound)
        : io_(io), inbound(inbound.begin(), inbound.end()) {}

    void async_receive(ReceiveHandler done) override {
        ++receives;
        auto self = shared_from_this();
        boost::asio::post(io_, [self, done] {
            if (self->inbound.empty()) {
                done(ChannelStatus::Closed, {});
                return;
            }
            std::string msg = self->inbound.front();
            self->inbound.pop_front();
            done(ChannelStatus::Ok, msg);
        });
    }

    void async_send(std::string message, SendHandler done) override {
        outbound.push_back(std::move(message));
        boost::asio::post(io_, [done] { done(ChannelStatus::Ok); });
    }

    void close() noexcept override { ++closes; }
    std::string peer() const override { return "fake:1"; }

    std::deque<std::string>  inbound;
    std::vector<std::string> outbound;
    int receives{0};
    int closes{0};

private:
    boost::asio::io_context& io_;
};

} // namespace testing
} // namespace pixelbridge
