// ============================================================================
// config.cpp: implementation for config.hpp
// ============================================================================

#include "pixelbridge/config.hpp"

#include <cctype>      // std::isxdigit
#include <fstream>     // std::ifstream for the config file
#include <limits>      // std::numeric_limits for int-sized keys
#include <sstream>     // slurp file into a string

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace pixelbridge {

bool is_valid_uuid(const std::string& s) {
    if (s.size() != 36) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const bool dash = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit((unsigned char)s[i])) {
            return false;
        }
    }
    return true;
}

// ---------- typed field readers: absent is fine, wrong type is not ----------

static bool read_string(const json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) { err = std::string("bad_config:") + key; return false; }
    out = it->get<std::string>();
    return true;
}

// Integers are range-checked here so nothing wraps on the way into an int.
static bool read_int(const json& j, const char* key, long long lo, long long hi,
                     long long& out, bool& present, std::string& err) {
    present = false;
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_integer()) { err = std::string("bad_config:") + key; return false; }
    if (it->is_number_unsigned() && it->get<unsigned long long>() > (unsigned long long)hi) {
        err = std::string("bad_config:") + key;
        return false;
    }
    const long long v = it->get<long long>();
    if (v < lo || v > hi) { err = std::string("bad_config:") + key; return false; }
    out = v;
    present = true;
    return true;
}

bool apply_config_json(const std::string& text, BridgeConfig& cfg, std::string& err) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        err = std::string("bad_config_syntax: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        err = "bad_config: top level must be an object";
        return false;
    }

    BridgeConfig c = cfg;   // commit only if every key is valid

    if (!read_string(j, "address", c.address, err))               return false;
    if (!read_string(j, "address_type", c.address_type, err))     return false;
    if (!read_string(j, "host", c.host, err))                     return false;
    if (!read_string(j, "characteristic", c.characteristic, err)) return false;

    std::string level;
    if (!read_string(j, "log_level", level, err)) return false;
    if (!level.empty() && !parse_log_level(level, c.log_level)) {
        err = "bad_config:log_level";
        return false;
    }

    constexpr long long INT_CAP = std::numeric_limits<int>::max();
    constexpr long long MS_CAP  = 24LL * 60 * 60 * 1000;   // a day

    long long v = 0;
    bool present = false;
    if (!read_int(j, "port", 1, 65535, v, present, err)) return false;
    if (present) c.port = (int)v;
    if (!read_int(j, "max_retries", 1, INT_CAP, v, present, err)) return false;
    if (present) c.retry.max_retries = (int)v;
    if (!read_int(j, "retry_delay_ms", 0, MS_CAP, v, present, err)) return false;
    if (present) c.retry.retry_delay = std::chrono::milliseconds(v);
    if (!read_int(j, "connect_timeout_ms", 1, MS_CAP, v, present, err)) return false;
    if (present) c.connect_timeout = std::chrono::milliseconds(v);
    if (!read_int(j, "max_recoveries", 0, INT_CAP, v, present, err)) return false;
    if (present) c.max_recoveries = (int)v;

    cfg = c;
    return true;
}

bool load_config_file(const std::string& path, BridgeConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "config_open_failed path=" + path;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return apply_config_json(ss.str(), cfg, err);
}

bool validate_config(const BridgeConfig& cfg, std::string& err) {
    if (cfg.address.empty())                       { err = "missing_address"; return false; }
    if (cfg.address_type != "public" && cfg.address_type != "random")
                                                   { err = "bad_address_type:" + cfg.address_type; return false; }
    if (cfg.port < 1 || cfg.port > 65535)          { err = "bad_port:" + std::to_string(cfg.port); return false; }
    if (cfg.retry.max_retries < 1)                 { err = "bad_max_retries"; return false; }
    if (cfg.retry.retry_delay.count() < 0)         { err = "bad_retry_delay"; return false; }
    if (cfg.connect_timeout.count() <= 0)          { err = "bad_connect_timeout"; return false; }
    if (cfg.max_recoveries < 0)                    { err = "bad_max_recoveries"; return false; }
    if (!is_valid_uuid(cfg.characteristic))        { err = "bad_characteristic:" + cfg.characteristic; return false; }
    return true;
}

// ============================================================================
// Command-line layer
// ============================================================================

bool select_mode(bool server, bool list_commands, const std::vector<std::string>& command,
                 RunMode& mode, std::string& err) {
    if (list_commands) {
        mode = RunMode::ListCommands;
        return true;
    }
    if (server && !command.empty()) { err = "conflicting_modes"; return false; }
    if (server)                     { mode = RunMode::Server;  return true; }
    if (!command.empty())           { mode = RunMode::OneShot; return true; }
    err = "no_mode_specified";
    return false;
}

bool apply_overrides(const ConfigOverrides& o, BridgeConfig& cfg, std::string& err) {
    BridgeConfig c = cfg;

    if (o.address)            c.address = *o.address;
    if (o.address_type)       c.address_type = *o.address_type;
    if (o.host)               c.host = *o.host;
    if (o.port)               c.port = *o.port;
    if (o.max_retries)        c.retry.max_retries = *o.max_retries;
    if (o.retry_delay_ms)     c.retry.retry_delay = std::chrono::milliseconds(*o.retry_delay_ms);
    if (o.connect_timeout_ms) c.connect_timeout = std::chrono::milliseconds(*o.connect_timeout_ms);
    if (o.max_recoveries)     c.max_recoveries = *o.max_recoveries;
    if (o.log_level && !parse_log_level(*o.log_level, c.log_level)) {
        err = "bad_log_level:" + *o.log_level;
        return false;
    }
    if (o.verbose) c.log_level = LogLevel::Debug;
    if (o.quiet)   c.log_level = LogLevel::Error;

    cfg = c;
    return true;
}

bool resolve_config(const std::string& config_path, const ConfigOverrides& o,
                    BridgeConfig& cfg, std::string& err) {
    BridgeConfig c = cfg;
    if (!config_path.empty() && !load_config_file(config_path, c, err)) return false;
    if (!apply_overrides(o, c, err)) return false;
    if (!validate_config(c, err)) return false;
    cfg = c;
    return true;
}

} // namespace pixelbridge
