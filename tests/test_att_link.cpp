#include <doctest/doctest.h>
#include "pixelbridge/att_link.hpp"
#include "pixelbridge/device_session.hpp"

using namespace pixelbridge;

TEST_CASE("16-bit UUIDs expand onto the Bluetooth base UUID") {
    CHECK(expand_uuid16(0xFA02) == PIXEL_CHARACTERISTIC);
    CHECK(expand_uuid16(0x2803) == "00002803-0000-1000-8000-00805f9b34fb");
}

TEST_CASE("128-bit UUIDs arrive little-endian") {
    // 0000fa02-0000-1000-8000-00805f9b34fb, reversed
    const uint8_t le[16] = {0xfb, 0x34, 0x9b, 0x5f, 0x80, 0x00, 0x00, 0x80,
                            0x00, 0x10, 0x00, 0x00, 0x02, 0xfa, 0x00, 0x00};
    CHECK(uuid128_from_le(le) == PIXEL_CHARACTERISTIC);
}

TEST_CASE("write before connect is refused, not sent") {
    boost::asio::io_context io;
    AttLink::Options opt;
    opt.address = "AA:BB:CC:DD:EE:FF";
    auto link = std::make_shared<AttLink>(io, opt);
    CHECK_FALSE(link->is_connected());

    LinkStatus st = LinkStatus::Ok;
    link->async_write(PIXEL_CHARACTERISTIC, {0x04, 0x00, 0x03, 0x80},
                      [&](LinkStatus s, const std::string&) { st = s; });
    io.run();
    CHECK(st != LinkStatus::Ok);
    link->disconnect();
    link->disconnect();
}

TEST_CASE("fresh link starts at the default ATT MTU") {
    boost::asio::io_context io;
    AttLink::Options opt;
    opt.address = "AA:BB:CC:DD:EE:FF";
    auto link = std::make_shared<AttLink>(io, opt);
    CHECK(link->mtu() == 23);
}

TEST_CASE("connect completes exactly once, even when the deadline races it") {
    // With an adapter this exercises the connect deadline; without one the
    // socket cannot be opened. Either way the handler runs once with failure.
    boost::asio::io_context io;
    AttLink::Options opt;
    opt.address = "00:00:00:00:00:01";
    opt.connect_timeout = std::chrono::milliseconds(1);
    auto link = std::make_shared<AttLink>(io, opt);

    int calls = 0;
    bool connected = true;
    std::string reason;
    link->async_connect([&](bool ok, const std::string& why) {
        ++calls;
        connected = ok;
        reason = why;
    });
    io.run_for(std::chrono::seconds(5));

    CHECK(calls == 1);
    CHECK_FALSE(connected);
    CHECK_FALSE(reason.empty());
    CHECK_FALSE(link->is_connected());
    link->disconnect();
}

TEST_CASE("malformed address fails without opening a socket") {
    boost::asio::io_context io;
    AttLink::Options opt;
    opt.address = "not-an-address";
    auto link = std::make_shared<AttLink>(io, opt);

    std::string reason;
    link->async_connect([&](bool, const std::string& why) { reason = why; });
    io.run();
    CHECK(reason == "bad_address");
}
