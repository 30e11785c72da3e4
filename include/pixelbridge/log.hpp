#pragma once
/**
 * @file log.hpp
 * @brief Shell-friendly `key=value` diagnostic lines on stderr.
 *
 * @details
 * Every line looks like
 * @code
 *   level=info event=ble_connected addr=AA:BB:CC:DD:EE:FF attempt=1/5
 * @endcode
 * so operators can grep, cut or feed it to a log shipper without a parser.
 * Values containing spaces, quotes or '=' are double-quoted.
 *
 * The threshold is process-wide and set once from the CLI (`--log-level`,
 * `-v`, `-q`). The sink defaults to std::cerr; tests swap it for an
 * ostringstream to assert on emitted events.
 */

#include <initializer_list>
#include <iosfwd>
#include <string>
#include <utility>

namespace pixelbridge {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

using LogField = std::pair<const char*, std::string>;

void set_log_level(LogLevel level);
LogLevel log_level();

/// Redirect output. nullptr restores std::cerr.
void set_log_sink(std::ostream* sink);

/// Parse "debug|info|warn|error". Returns false on anything else.
bool parse_log_level(const std::string& name, LogLevel& out);
const char* to_string(LogLevel level);

void log(LogLevel level, const char* event, std::initializer_list<LogField> fields = {});

inline void log_debug(const char* event, std::initializer_list<LogField> fields = {}) { log(LogLevel::Debug, event, fields); }
inline void log_info (const char* event, std::initializer_list<LogField> fields = {}) { log(LogLevel::Info,  event, fields); }
inline void log_warn (const char* event, std::initializer_list<LogField> fields = {}) { log(LogLevel::Warn,  event, fields); }
inline void log_error(const char* event, std::initializer_list<LogField> fields = {}) { log(LogLevel::Error, event, fields); }

} // namespace pixelbridge
