#pragma once
/**
 * @file config.hpp
 * @brief Bridge configuration: defaults, JSON config file, validation.
 *
 * Precedence, lowest first: built-in defaults → `--config <file>` → options
 * given explicitly on the command line. The CLI applies the last step; this
 * module owns the first two and the final validation.
 *
 * Config file (every key optional):
 * @code
 *   {
 *     "address": "AA:BB:CC:DD:EE:FF",
 *     "address_type": "public",
 *     "host": "localhost",
 *     "port": 4444,
 *     "max_retries": 5,
 *     "retry_delay_ms": 5000,
 *     "connect_timeout_ms": 10000,
 *     "max_recoveries": 3,
 *     "characteristic": "0000fa02-0000-1000-8000-00805f9b34fb",
 *     "log_level": "info"
 *   }
 * @endcode
 * Unknown keys are ignored. A known key with the wrong JSON type is an error.
 */

#include "pixelbridge/device_session.hpp"
#include "pixelbridge/log.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pixelbridge {

struct BridgeConfig {
    std::string               address;
    std::string               address_type{"public"};   // public | random
    std::string               host{"localhost"};
    int                       port{4444};
    RetryPolicy               retry{};
    std::chrono::milliseconds connect_timeout{10000};
    int                       max_recoveries{3};
    std::string               characteristic{PIXEL_CHARACTERISTIC};
    LogLevel                  log_level{LogLevel::Info};
};

/// Merge a JSON config file into @p cfg. false + reason on I/O, syntax or type errors.
bool load_config_file(const std::string& path, BridgeConfig& cfg, std::string& err);

/// Same as load_config_file() but from already-read text.
bool apply_config_json(const std::string& text, BridgeConfig& cfg, std::string& err);

/// Final sanity check before anything connects.
bool validate_config(const BridgeConfig& cfg, std::string& err);

/// 8-4-4-4-12 hex digits.
bool is_valid_uuid(const std::string& s);

// ---------------------------------------------------------------------------
// Command-line layer
// ---------------------------------------------------------------------------

enum class RunMode : uint8_t { Server, OneShot, ListCommands };

/**
 * @brief Pick the single mode an invocation runs in.
 *
 * --list-commands wins over everything and needs no device. Otherwise exactly
 * one of --server or -c NAME [PARAMS...] must be present.
 * Errors: `no_mode_specified`, `conflicting_modes`.
 */
bool select_mode(bool server, bool list_commands, const std::vector<std::string>& command,
                 RunMode& mode, std::string& err);

/// Options actually given on the command line; unset ones leave cfg alone.
struct ConfigOverrides {
    std::optional<std::string> address;
    std::optional<std::string> address_type;
    std::optional<std::string> host;
    std::optional<int>         port;
    std::optional<int>         max_retries;
    std::optional<long>        retry_delay_ms;
    std::optional<long>        connect_timeout_ms;
    std::optional<int>         max_recoveries;
    std::optional<std::string> log_level;
    bool                       verbose{false};   // beats log_level
    bool                       quiet{false};     // beats verbose
};

/// Overlay @p o onto @p cfg. false + `bad_log_level` on an unknown level name.
bool apply_overrides(const ConfigOverrides& o, BridgeConfig& cfg, std::string& err);

/// defaults <- config file (if @p config_path non-empty) <- @p o, then validate_config().
bool resolve_config(const std::string& config_path, const ConfigOverrides& o,
                    BridgeConfig& cfg, std::string& err);

} // namespace pixelbridge
