// ============================================================================
// log.cpp: implementation for log.hpp
// ============================================================================

#include "pixelbridge/log.hpp"

#include <iostream>   // std::cerr default sink

namespace pixelbridge {

static LogLevel      g_level = LogLevel::Info;
static std::ostream* g_sink  = nullptr;

void set_log_level(LogLevel level) { g_level = level; }
LogLevel log_level() { return g_level; }

void set_log_sink(std::ostream* sink) { g_sink = sink; }

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info")  { out = LogLevel::Info;  return true; }
    if (name == "warn")  { out = LogLevel::Warn;  return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    return false;
}

// Quote only when a naive `cut -d= ` would break on the value.
static void write_value(std::ostream& os, const std::string& v) {
    bool quote = v.empty();
    for (char c : v) {
        if (c == ' ' || c == '"' || c == '=' || c == '\t') { quote = true; break; }
    }
    if (!quote) { os << v; return; }

    os << '"';
    for (char c : v) {
        if (c == '"' || c == '\\') os << '\\';
        if (c == '\n') { os << "\\n"; continue; }
        os << c;
    }
    os << '"';
}

void log(LogLevel level, const char* event, std::initializer_list<LogField> fields) {
    if (static_cast<int>(level) < static_cast<int>(g_level)) return;

    std::ostream& os = g_sink ? *g_sink : std::cerr;
    os << "level=" << to_string(level) << " event=" << event;
    for (const auto& f : fields) {
        os << ' ' << f.first << '=';
        write_value(os, f.second);
    }
    os << '\n';
    os.flush();
}

} // namespace pixelbridge
