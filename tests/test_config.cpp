#include <doctest/doctest.h>
#include "pixelbridge/config.hpp"
#include "pixelbridge/log.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

using namespace pixelbridge;
using std::chrono::milliseconds;

TEST_CASE("defaults match the documented bridge behaviour") {
    BridgeConfig c;
    CHECK(c.host == "localhost");
    CHECK(c.port == 4444);
    CHECK(c.retry.max_retries == 5);
    CHECK(c.retry.retry_delay == milliseconds(5000));
    CHECK(c.max_recoveries == 3);
    CHECK(c.characteristic == "0000fa02-0000-1000-8000-00805f9b34fb");
}

TEST_CASE("config JSON overrides only the keys it names") {
    BridgeConfig c;
    std::string err;
    REQUIRE(apply_config_json(R"({"address":"11:22:33:44:55:66","port":9000,
                                  "retry_delay_ms":250,"log_level":"debug"})", c, err));
    CHECK(c.address == "11:22:33:44:55:66");
    CHECK(c.port == 9000);
    CHECK(c.retry.retry_delay == milliseconds(250));
    CHECK(c.retry.max_retries == 5);
    CHECK(c.host == "localhost");
    CHECK(c.log_level == LogLevel::Debug);
}

TEST_CASE("config JSON: a bad key leaves the config untouched") {
    BridgeConfig c;
    std::string err;
    CHECK_FALSE(apply_config_json(R"({"address":"11:22:33:44:55:66","port":"9000"})", c, err));
    CHECK(err == "bad_config:port");
    CHECK(c.address.empty());

    CHECK_FALSE(apply_config_json(R"({"log_level":"loud"})", c, err));
    CHECK(err == "bad_config:log_level");

    CHECK_FALSE(apply_config_json("{", c, err));
    CHECK(err.find("bad_config_syntax") == 0);

    CHECK_FALSE(apply_config_json("[]", c, err));
}

TEST_CASE("missing config file is reported") {
    BridgeConfig c;
    std::string err;
    CHECK_FALSE(load_config_file("/nonexistent/pixelbridge.json", c, err));
    CHECK(err == "config_open_failed path=/nonexistent/pixelbridge.json");
}

TEST_CASE("validate_config") {
    BridgeConfig c;
    std::string err;
    CHECK_FALSE(validate_config(c, err));
    CHECK(err == "missing_address");

    c.address = "AA:BB:CC:DD:EE:FF";
    CHECK(validate_config(c, err));

    BridgeConfig bad = c;
    bad.address_type = "static";
    CHECK_FALSE(validate_config(bad, err));
    CHECK(err == "bad_address_type:static");

    bad = c;
    bad.port = 0;
    CHECK_FALSE(validate_config(bad, err));
    CHECK(err == "bad_port:0");

    bad = c;
    bad.retry.max_retries = 0;
    CHECK_FALSE(validate_config(bad, err));
    CHECK(err == "bad_max_retries");

    bad = c;
    bad.characteristic = "fa02";
    CHECK_FALSE(validate_config(bad, err));
    CHECK(err == "bad_characteristic:fa02");
}

TEST_CASE("is_valid_uuid") {
    CHECK(is_valid_uuid("0000FA02-0000-1000-8000-00805f9b34fb"));
    CHECK_FALSE(is_valid_uuid("0000fa02000010008000-00805f9b34fb"));
    CHECK_FALSE(is_valid_uuid("0000fa0z-0000-1000-8000-00805f9b34fb"));
}

TEST_CASE("log lines are key=value and filtered by level") {
    std::ostringstream sink;
    set_log_sink(&sink);
    set_log_level(LogLevel::Info);

    log_debug("hidden");
    log_info("ble_connected", {{"addr", "AA:BB"}, {"reason", "two words"}, {"empty", ""}});
    CHECK(sink.str() == "level=info event=ble_connected addr=AA:BB reason=\"two words\" empty=\"\"\n");

    sink.str("");
    set_log_level(LogLevel::Error);
    log_warn("quiet");
    CHECK(sink.str().empty());

    set_log_level(LogLevel::Info);
    set_log_sink(nullptr);
}

TEST_CASE("parse_log_level") {
    LogLevel l = LogLevel::Info;
    CHECK(parse_log_level("warn", l));
    CHECK(l == LogLevel::Warn);
    CHECK_FALSE(parse_log_level("WARN", l));
    CHECK(std::string(to_string(LogLevel::Error)) == "error");
}

TEST_CASE("config JSON: integers out of range are rejected, not wrapped") {
    BridgeConfig c;
    std::string err;
    CHECK_FALSE(apply_config_json(R"({"port":4294971740})", c, err));
    CHECK(err == "bad_config:port");
    CHECK(c.port == 4444);

    CHECK_FALSE(apply_config_json(R"({"port":70000})", c, err));
    CHECK(err == "bad_config:port");

    CHECK_FALSE(apply_config_json(R"({"max_retries":18446744073709551615})", c, err));
    CHECK(err == "bad_config:max_retries");

    CHECK_FALSE(apply_config_json(R"({"retry_delay_ms":-1})", c, err));
    CHECK(err == "bad_config:retry_delay_ms");

    CHECK_FALSE(apply_config_json(R"({"max_recoveries":-2})", c, err));
    CHECK(err == "bad_config:max_recoveries");

    CHECK(apply_config_json(R"({"port":65535,"retry_delay_ms":0,"max_recoveries":0})", c, err));
    CHECK(c.port == 65535);
}

TEST_CASE("select_mode: exactly one mode per invocation") {
    RunMode mode = RunMode::Server;
    std::string err;

    CHECK_FALSE(select_mode(false, false, {}, mode, err));
    CHECK(err == "no_mode_specified");

    CHECK_FALSE(select_mode(true, false, {"clear"}, mode, err));
    CHECK(err == "conflicting_modes");

    REQUIRE(select_mode(true, false, {}, mode, err));
    CHECK(mode == RunMode::Server);

    REQUIRE(select_mode(false, false, {"set_brightness", "80"}, mode, err));
    CHECK(mode == RunMode::OneShot);
}

TEST_CASE("select_mode: --list-commands needs neither a mode nor an address") {
    RunMode mode = RunMode::Server;
    std::string err;
    REQUIRE(select_mode(false, true, {}, mode, err));
    CHECK(mode == RunMode::ListCommands);
    REQUIRE(select_mode(true, true, {}, mode, err));
    CHECK(mode == RunMode::ListCommands);
}

TEST_CASE("resolve_config: defaults <- file <- command line") {
    const std::string path = "pixelbridge_test_config.json";
    {
        std::ofstream f(path);
        f << R"({"address":"11:22:33:44:55:66","port":9000,"host":"0.0.0.0","max_retries":2})";
    }

    ConfigOverrides o;
    o.port = 5000;
    o.verbose = true;

    BridgeConfig c;
    std::string err;
    REQUIRE(resolve_config(path, o, c, err));
    CHECK(c.address == "11:22:33:44:55:66");     // file
    CHECK(c.host == "0.0.0.0");                   // file
    CHECK(c.port == 5000);                        // command line beats file
    CHECK(c.retry.max_retries == 2);              // file beats default
    CHECK(c.retry.retry_delay == milliseconds(5000));   // default
    CHECK(c.log_level == LogLevel::Debug);

    o.quiet = true;
    REQUIRE(resolve_config(path, o, c, err));
    CHECK(c.log_level == LogLevel::Error);
    std::remove(path.c_str());
}

TEST_CASE("resolve_config: nothing is committed on failure") {
    BridgeConfig c;
    std::string err;

    ConfigOverrides no_address;
    no_address.port = 5000;
    CHECK_FALSE(resolve_config("", no_address, c, err));
    CHECK(err == "missing_address");
    CHECK(c.port == 4444);

    ConfigOverrides bad_level;
    bad_level.address = "AA:BB:CC:DD:EE:FF";
    bad_level.log_level = "chatty";
    CHECK_FALSE(resolve_config("", bad_level, c, err));
    CHECK(err == "bad_log_level:chatty");
    CHECK(c.address.empty());

    ConfigOverrides ok;
    ok.address = "AA:BB:CC:DD:EE:FF";
    ok.address_type = "random";
    ok.retry_delay_ms = 250;
    ok.connect_timeout_ms = 3000;
    ok.max_recoveries = 1;
    REQUIRE(resolve_config("", ok, c, err));
    CHECK(c.address_type == "random");
    CHECK(c.retry.retry_delay == milliseconds(250));
    CHECK(c.connect_timeout == milliseconds(3000));
    CHECK(c.max_recoveries == 1);
}
