#include <doctest/doctest.h>
#include "fakes.hpp"
#include "pixelbridge/device_session.hpp"

#include <boost/asio/io_context.hpp>

using namespace pixelbridge;
using namespace pixelbridge::testing;
using std::chrono::milliseconds;

namespace {

struct Rig {
    boost::asio::io_context io;
    FakeScheduler           sched{io};
    FakeDevice              dev{io};

    std::shared_ptr<DeviceSession> session(RetryPolicy p = RetryPolicy{}) {
        return DeviceSession::create("AA:BB:CC:DD:EE:FF", dev.factory(), sched, p);
    }
};

} // namespace

TEST_CASE("acquire: connects on the first attempt") {
    Rig r;
    auto s = r.session();
    bool called = false;
    AcquireResult got = AcquireResult::Unavailable;
    s->async_acquire([&](AcquireResult a) { called = true; got = a; });
    r.io.run();

    CHECK(called);
    CHECK(got == AcquireResult::Connected);
    CHECK(s->state() == SessionState::Connected);
    CHECK(r.dev.connect_attempts == 1);
    CHECK(r.sched.delays.empty());
    CHECK(s->last_attempts() == 1);
}

TEST_CASE("acquire: retries with a fixed delay between attempts") {
    Rig r;
    r.dev.connect_script = {false, false, true};
    auto s = r.session(RetryPolicy{5, milliseconds(5000)});
    CHECK(s->policy().max_retries == 5);
    CHECK(s->policy().retry_delay == milliseconds(5000));
    AcquireResult got = AcquireResult::Unavailable;
    s->async_acquire([&](AcquireResult a) { got = a; });
    r.io.run();

    CHECK(got == AcquireResult::Connected);
    CHECK(r.dev.connect_attempts == 3);
    REQUIRE(r.sched.delays.size() == 2);
    CHECK(r.sched.delays[0] == milliseconds(5000));
    CHECK(r.sched.delays[1] == milliseconds(5000));
    CHECK(r.dev.live == 1);
}

TEST_CASE("acquire: unavailable after exactly max_retries attempts") {
    Rig r;
    r.dev.connect_default = false;
    auto s = r.session(RetryPolicy{5, milliseconds(5000)});
    AcquireResult got = AcquireResult::Connected;
    s->async_acquire([&](AcquireResult a) { got = a; });
    r.io.run();

    CHECK(got == AcquireResult::Unavailable);
    CHECK(r.dev.connect_attempts == 5);
    CHECK(r.sched.delays.size() == 4);       // no wait after the last attempt
    CHECK(r.sched.now == milliseconds(20000));
    CHECK(s->state() == SessionState::Disconnected);
    CHECK(s->last_attempts() == 5);
    CHECK(r.dev.live == 0);
}

TEST_CASE("acquire: max_retries of one means a single attempt") {
    Rig r;
    r.dev.connect_default = false;
    auto s = r.session(RetryPolicy{1, milliseconds(10)});
    s->async_acquire([](AcquireResult) {});
    r.io.run();
    CHECK(r.dev.connect_attempts == 1);
    CHECK(r.sched.delays.empty());
}

TEST_CASE("release during backoff stops further attempts") {
    Rig r;
    r.dev.connect_default = false;
    auto s = r.session(RetryPolicy{5, milliseconds(5000)});
    AcquireResult got = AcquireResult::Connected;
    s->async_acquire([&](AcquireResult a) { got = a; });
    r.io.run_one();     // first connect outcome is posted
    s->release();
    r.io.run();

    CHECK(got == AcquireResult::Unavailable);
    CHECK(r.dev.connect_attempts == 1);
}

TEST_CASE("write: delivers payload to the pixel characteristic") {
    Rig r;
    auto s = r.session();
    WriteResult wr = WriteResult::TransportLost;
    s->async_acquire([&](AcquireResult) {
        s->async_write(make_clear(), [&](WriteResult w, const std::string&) { wr = w; });
    });
    r.io.run();

    CHECK(wr == WriteResult::Ok);
    REQUIRE(r.dev.writes.size() == 1);
    CHECK(r.dev.writes[0].characteristic == PIXEL_CHARACTERISTIC);
    CHECK(r.dev.writes[0].data == make_clear());
}

TEST_CASE("write: without a live link reports transport loss and writes nothing") {
    Rig r;
    auto s = r.session();
    WriteResult wr = WriteResult::Ok;
    s->async_write(make_clear(), [&](WriteResult w, const std::string&) { wr = w; });
    r.io.run();
    CHECK(wr == WriteResult::TransportLost);
    CHECK(r.dev.writes.empty());
}

TEST_CASE("write: link failure marks the session lost") {
    Rig r;
    r.dev.write_script = {LinkStatus::Lost};
    auto s = r.session();
    WriteResult wr = WriteResult::Ok;
    s->async_acquire([&](AcquireResult) {
        s->async_write(make_clear(), [&](WriteResult w, const std::string&) { wr = w; });
    });
    r.io.run();
    CHECK(wr == WriteResult::TransportLost);
    CHECK(s->state() == SessionState::Lost);
}

TEST_CASE("write: a refused write keeps the link and is not a transport loss") {
    Rig r;
    r.dev.write_script = {LinkStatus::Failed};
    auto s = r.session();
    WriteResult wr = WriteResult::Ok;
    std::string reason;
    s->async_acquire([&](AcquireResult) {
        s->async_write(make_clear(), [&](WriteResult w, const std::string& why) {
            wr = w;
            reason = why;
        });
    });
    r.io.run();
    CHECK(wr == WriteResult::Failed);
    CHECK(reason == "characteristic_not_found");
    CHECK(s->state() == SessionState::Connected);
    CHECK(r.dev.live == 1);
    CHECK(r.dev.connect_attempts == 1);
}

TEST_CASE("release is idempotent and reacquire never leaves two live links") {
    Rig r;
    auto s = r.session();
    s->async_acquire([](AcquireResult) {});
    r.io.run();
    REQUIRE(r.dev.live == 1);

    s->release();
    s->release();
    CHECK(r.dev.live == 0);
    CHECK(s->state() == SessionState::Disconnected);

    r.io.restart();
    s->async_acquire([](AcquireResult) {});
    r.io.run();
    r.io.restart();
    s->async_acquire([](AcquireResult) {});   // already connected: no new link
    r.io.run();
    CHECK(r.dev.connect_attempts == 2);
    CHECK(r.dev.max_live == 1);
}

TEST_CASE("destroying the session releases the link") {
    Rig r;
    {
        auto s = r.session();
        s->async_acquire([](AcquireResult) {});
        r.io.run();
        CHECK(r.dev.live == 1);
    }
    CHECK(r.dev.live == 0);
}
