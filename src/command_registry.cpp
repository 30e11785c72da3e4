// -----------------------------------------------------------------------------
// Implementation for command_registry.hpp
//
// - String → typed value converters (no exceptions; bool + reason).
// - Schema binding for positional/keyword arguments.
// - The pixel display's command table.
// -----------------------------------------------------------------------------

#include "pixelbridge/command_registry.hpp"

#include <cctype>      // std::tolower, std::isxdigit
#include <cerrno>      // ERANGE from strtol
#include <cstdlib>     // std::strtol
#include <ctime>       // std::time, localtime_r
#include <fstream>     // reading GIF files for send_animation
#include <iterator>    // std::istreambuf_iterator
#include <stdexcept>   // std::invalid_argument on bad registry construction

namespace pixelbridge {

const char* to_string(ParamType t) {
    switch (t) {
        case ParamType::Integer: return "int";
        case ParamType::Boolean: return "bool";
        case ParamType::Color:   return "color";
        case ParamType::Text:    return "text";
        case ParamType::Date:    return "date";
    }
    return "?";
}

// ---------- local parsing helpers (no exceptions) ----------

static bool parse_long(const std::string& s, long& out) {
    if (s.empty()) return false;
    if (std::isspace((unsigned char)s.front())) return false;   // strtol would skip it
    char* e = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &e, 10);
    if (!e || *e || errno == ERANGE) return false;
    out = v;
    return true;
}

static std::string lower(std::string s) {
    for (auto& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static bool parse_bool(const std::string& raw, bool& out) {
    const std::string s = lower(raw);
    if (s == "true" || s == "1" || s == "yes" || s == "on")  { out = true;  return true; }
    if (s == "false"|| s == "0" || s == "no"  || s == "off") { out = false; return true; }
    return false;
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = (char)std::tolower((unsigned char)c);
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

static bool parse_color(const std::string& raw, Rgb& out) {
    std::string s = raw;
    if (!s.empty() && s.front() == '#') s.erase(0, 1);
    if (s.size() != 6) return false;

    uint8_t v[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = hex_nibble(s[i * 2]);
        const int lo = hex_nibble(s[i * 2 + 1]);
        if (hi < 0 || lo < 0) return false;
        v[i] = (uint8_t)((hi << 4) | lo);
    }
    out = Rgb{v[0], v[1], v[2]};
    return true;
}

static int days_in_month(int month, int year) {
    static const int d[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return d[month - 1];
}

// DD/MM/YYYY
static bool parse_date(const std::string& s, CalendarDate& out) {
    const auto a = s.find('/');
    if (a == std::string::npos) return false;
    const auto b = s.find('/', a + 1);
    if (b == std::string::npos) return false;

    long day = 0, month = 0, year = 0;
    if (!parse_long(s.substr(0, a), day)) return false;
    if (!parse_long(s.substr(a + 1, b - a - 1), month)) return false;
    if (!parse_long(s.substr(b + 1), year)) return false;

    if (year < 2000 || year > 2099) return false;
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > days_in_month((int)month, (int)year)) return false;

    out = CalendarDate{(int)year, (int)month, (int)day};
    return true;
}

bool convert_value(const ParamSpec& spec, const std::string& raw, ArgValue& out, std::string& err) {
    ArgValue v;
    v.type = spec.type;

    switch (spec.type) {
    case ParamType::Integer:
        if (!parse_long(raw, v.integer)) {
            err = "invalid value for '" + spec.name + "': expected an integer, got '" + raw + "'";
            return false;
        }
        if (v.integer < spec.min || v.integer > spec.max) {
            err = "invalid value for '" + spec.name + "': must be between "
                + std::to_string(spec.min) + " and " + std::to_string(spec.max);
            return false;
        }
        break;

    case ParamType::Boolean:
        if (!parse_bool(raw, v.boolean)) {
            err = "invalid value for '" + spec.name + "': expected true or false, got '" + raw + "'";
            return false;
        }
        break;

    case ParamType::Color:
        if (!parse_color(raw, v.color)) {
            err = "invalid value for '" + spec.name + "': expected a hex color rrggbb, got '" + raw + "'";
            return false;
        }
        break;

    case ParamType::Text:
        if ((long)raw.size() < spec.min || (long)raw.size() > spec.max) {
            err = "invalid value for '" + spec.name + "': length must be between "
                + std::to_string(spec.min) + " and " + std::to_string(spec.max);
            return false;
        }
        v.text = raw;
        break;

    case ParamType::Date:
        if (!parse_date(raw, v.date)) {
            err = "invalid value for '" + spec.name + "': expected DD/MM/YYYY, got '" + raw + "'";
            return false;
        }
        break;
    }

    out = std::move(v);
    return true;
}

// ---------- binding ----------

bool bind_arguments(const CommandSpec& spec, const Envelope& env, BoundArgs& out, std::string& err) {
    const std::size_t max_args = spec.params.size();
    if (env.positional.size() > max_args) {
        err = spec.name + "() takes at most " + std::to_string(max_args)
            + (max_args == 1 ? " argument (" : " arguments (")
            + std::to_string(env.positional.size()) + " given)";
        return false;
    }

    // Phase 1: collect raw strings per parameter name.
    std::map<std::string, std::string> raw;
    for (std::size_t i = 0; i < env.positional.size(); ++i)
        raw[spec.params[i].name] = env.positional[i];

    for (const auto& kv : env.keyword) {
        bool known = false;
        for (const auto& p : spec.params)
            if (p.name == kv.first) { known = true; break; }
        if (!known) {
            err = spec.name + "() got an unexpected keyword argument '" + kv.first + "'";
            return false;
        }
        if (raw.count(kv.first)) {
            err = spec.name + "() got multiple values for argument '" + kv.first + "'";
            return false;
        }
        raw[kv.first] = kv.second;
    }

    // Phase 2: convert in declared order, applying defaults.
    BoundArgs bound;
    for (const auto& p : spec.params) {
        auto it = raw.find(p.name);
        const std::string* src = nullptr;
        if (it != raw.end())               src = &it->second;
        else if (!p.default_value.empty()) src = &p.default_value;

        if (!src) {
            if (p.required) {
                err = spec.name + "() missing required argument '" + p.name + "'";
                return false;
            }
            continue;
        }

        ArgValue v;
        if (!convert_value(p, *src, v, err)) return false;
        bound.set(p.name, std::move(v));
    }

    out = std::move(bound);
    return true;
}

std::string describe(const CommandSpec& spec) {
    std::string s = spec.name + "(";
    for (std::size_t i = 0; i < spec.params.size(); ++i) {
        const auto& p = spec.params[i];
        if (i) s += ", ";
        s += p.name;
        s += ':';
        s += to_string(p.type);
        if (!p.default_value.empty()) s += "=" + p.default_value;
        else if (!p.required)         s += "?";
    }
    s += ")";
    if (!spec.summary.empty()) s += " - " + spec.summary;
    return s;
}

// ---------- registry ----------

CommandRegistry::CommandRegistry(std::vector<CommandSpec> commands)
    : commands_(std::move(commands)) {
    for (std::size_t i = 0; i < commands_.size(); ++i) {
        const auto& c = commands_[i];
        if (c.name.empty())
            throw std::invalid_argument("command with empty name");
        if (!c.encode)
            throw std::invalid_argument("command without encoder: " + c.name);
        if (!index_.emplace(c.name, i).second)
            throw std::invalid_argument("duplicate command: " + c.name);
    }
}

const CommandSpec* CommandRegistry::resolve(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &commands_[it->second];
}

// ============================================================================
// Pixel display table
// ============================================================================

CalendarDate local_today() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    return CalendarDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

static ParamSpec int_param(const char* name, long lo, long hi, const char* def = "") {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::Integer;
    p.required = (*def == '\0');
    p.default_value = def;
    p.min = lo;
    p.max = hi;
    return p;
}

static ParamSpec bool_param(const char* name, const char* def) {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::Boolean;
    p.default_value = def;
    return p;
}

static ParamSpec color_param(const char* name, const char* def) {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::Color;
    p.default_value = def;
    return p;
}

static ParamSpec text_param(const char* name, long min_len, long max_len) {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::Text;
    p.required = true;
    p.min = min_len;
    p.max = max_len;
    return p;
}

static uint8_t u8(const BoundArgs& a, const char* name) { return (uint8_t)a.integer(name); }

static bool read_gif(const std::string& path, Bytes& out, std::string& err) {
    std::ifstream in(path, std::ios::binary);
    if (!in) { err = "cannot open animation file: " + path; return false; }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (out.size() < 6 || out[0] != 'G' || out[1] != 'I' || out[2] != 'F' || out[3] != '8') {
        err = "not a GIF file: " + path;
        return false;
    }
    return true;
}

CommandRegistry make_pixel_registry(DateSource today) {
    std::vector<CommandSpec> t;

    t.push_back({"clear", "clear the display", {},
        [](const BoundArgs&, Bytes& out, std::string&) {
            out = make_clear(); return true; }});

    t.push_back({"set_brightness", "brightness in percent", {int_param("brightness", 0, 100)},
        [](const BoundArgs& a, Bytes& out, std::string&) {
            out = make_set_brightness(u8(a, "brightness")); return true; }});

    t.push_back({"set_orientation", "rotate output by 90 degree steps", {int_param("orientation", 0, 3, "0")},
        [](const BoundArgs& a, Bytes& out, std::string&) {
            out = make_set_orientation(u8(a, "orientation")); return true; }});

    t.push_back({"set_fun_mode", "enter or leave DIY drawing mode", {bool_param("enable", "false")},
        [](const BoundArgs& a, Bytes& out, std::string&) {
            out = make_set_fun_mode(a.boolean("enable")); return true; }});

    t.push_back({"set_speed", "animation speed", {int_param("speed", 0, 100)},
        [](const BoundArgs& a, Bytes& out, std::string&) {
            out = make_set_speed(u8(a, "speed")); return true; }});

    t.push_back({"set_pixel", "draw one pixel (DIY mode)",
        {int_param("x", 0, 255), int_param("y", 0, 255), color_param("color", "ffffff")},
        [](const BoundArgs& a, Bytes& out, std::string&) {
            out = make_set_pixel(u8(a, "x"), u8(a, "y"), a.color("color")); return true; }});

    {
        ParamSpec date;
        date.name = "date";
        date.type = ParamType::Date;
        t.push_back({"set_clock_mode", "show the built-in clock",
            {int_param("style", 0, 8, "1"), bool_param("show_date", "true"),
             bool_param("format_24", "true"), date},
            [today](const BoundArgs& a, Bytes& out, std::string&) {
                const CalendarDate d = a.has("date") ? a.date("date") : today();
                out = make_set_clock_mode(u8(a, "style"), a.boolean("show_date"),
                                          a.boolean("format_24"), d);
                return true; }});
    }

    t.push_back({"set_screen", "show a saved screen", {int_param("screen", 1, 9)},
        [](const BoundArgs& a, Bytes& out, std::string&) {
            out = make_set_screen(u8(a, "screen")); return true; }});

    t.push_back({"delete_screen", "erase a saved screen", {int_param("screen", 1, 9)},
        [](const BoundArgs& a, Bytes& out, std::string&) {
            out = make_delete_screen(u8(a, "screen")); return true; }});

    t.push_back({"send_text", "scroll text",
        {text_param("text", 1, 500), color_param("color", "ffffff"),
         int_param("animation", 0, 7, "0"), int_param("speed", 0, 100, "80"),
         int_param("rainbow_mode", 0, 9, "0"), int_param("save_slot", 1, 9, "1")},
        [](const BoundArgs& a, Bytes& out, std::string&) {
            out = make_send_text(a.text("text"), a.color("color"), u8(a, "animation"),
                                 u8(a, "speed"), u8(a, "rainbow_mode"), u8(a, "save_slot"));
            return true; }});

    t.push_back({"send_animation", "upload a GIF file",
        {text_param("path", 1, 4096), int_param("save_slot", 1, 9, "1")},
        [](const BoundArgs& a, Bytes& out, std::string& err) {
            Bytes gif;
            if (!read_gif(a.text("path"), gif, err)) return false;
            out = make_send_animation(gif, u8(a, "save_slot"));
            return true; }});

    return CommandRegistry(std::move(t));
}

} // namespace pixelbridge
