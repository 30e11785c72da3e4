#pragma once
/**
 * @file bridge.hpp
 * @brief Process-level runners: WebSocket server mode and one-shot mode.
 *
 * Both build the same pieces (AsioScheduler, AttLink factory, Dispatcher over
 * the registry) on one io_context and block in io_context::run() until the
 * work is done or a SIGINT/SIGTERM arrives.
 *
 * Device sharing: each WebSocket client gets its own DeviceSession. Most
 * displays accept a single LE link, so a second concurrent client will
 * usually fail to acquire until the first disconnects.
 */

#include "pixelbridge/command_registry.hpp"
#include "pixelbridge/config.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace pixelbridge {

/// Serve until signalled. Returns the process exit code.
int run_server(const BridgeConfig& cfg, const CommandRegistry& registry, std::ostream& out);

/// Execute one command. Returns the process exit code (see OneShot).
int run_one_shot(const BridgeConfig& cfg, const CommandRegistry& registry,
                 const std::string& command, const std::vector<std::string>& params,
                 std::ostream& out, std::ostream& err);

} // namespace pixelbridge
