#pragma once
/**
 * @page pb-command-registry Command Registry
 * @file command_registry.hpp
 * @brief Immutable name → (parameter schema, encoder) table.
 *
 * @details
 * PURPOSE
 * -------
 * The registry is the only place that knows which commands exist and what
 * arguments each takes. It is built once at startup and handed to the
 * dispatcher by reference; nothing mutates it afterwards.
 *
 * WHAT THIS DOES
 * --------------
 * - `CommandSpec` pairs a name with a declared parameter list (`ParamSpec`:
 *   name, type, required/default, bounds) and an encode function.
 * - `bind_arguments()` maps an envelope's positional + keyword strings onto
 *   the schema and converts each value to its declared type. All argument
 *   errors (count, unknown keyword, duplicate, missing, bad value) are
 *   detected here, before any encoder runs, and come back as one readable
 *   message.
 * - `CommandRegistry::resolve()` is a pure lookup. An unknown name is a
 *   normal outcome (nullptr), not an error.
 * - `make_pixel_registry()` builds the table for the pixel display using the
 *   builders in encoders.hpp.
 *
 * BINDING RULES
 * -------------
 *   - positional tokens fill parameters in declared order
 *   - keyword tokens bind by name (names already normalized `-` → `_`)
 *   - a parameter bound twice is an error
 *   - unfilled parameters take their default; no default + required → error
 *   - Integer: base-10, range [min, max]
 *   - Boolean: true/false/1/0/yes/no/on/off, any case
 *   - Color:   rrggbb, optional leading '#'
 *   - Text:    byte length in [min, max]
 *   - Date:    DD/MM/YYYY
 */

#include "pixelbridge/encoders.hpp"
#include "pixelbridge/envelope.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace pixelbridge {

enum class ParamType : uint8_t { Integer, Boolean, Color, Text, Date };

const char* to_string(ParamType t);

struct ParamSpec {
    std::string name;
    ParamType   type{ParamType::Integer};
    bool        required{false};
    std::string default_value;   // raw text, converted like client input; empty = none
    long        min{0};          // Integer: value range, Text: byte length range
    long        max{0};
};

/// One converted argument.
struct ArgValue {
    ParamType    type{ParamType::Integer};
    long         integer{0};
    bool         boolean{false};
    Rgb          color{};
    std::string  text;
    CalendarDate date{};
};

/// Arguments after binding; only bound or defaulted parameters are present.
class BoundArgs {
public:
    bool has(const std::string& name) const { return values_.count(name) != 0; }

    long                integer(const std::string& name) const { return values_.at(name).integer; }
    bool                boolean(const std::string& name) const { return values_.at(name).boolean; }
    const Rgb&          color(const std::string& name)   const { return values_.at(name).color; }
    const std::string&  text(const std::string& name)    const { return values_.at(name).text; }
    const CalendarDate& date(const std::string& name)    const { return values_.at(name).date; }

    void set(const std::string& name, ArgValue v) { values_[name] = std::move(v); }
    std::size_t size() const { return values_.size(); }

private:
    std::map<std::string, ArgValue> values_;
};

using EncodeFn = std::function<bool(const BoundArgs& args, Bytes& out, std::string& err)>;

struct CommandSpec {
    std::string            name;
    std::string            summary;
    std::vector<ParamSpec> params;
    EncodeFn               encode;
};

/// Convert one raw string per @p spec. On failure @p err holds the reason.
bool convert_value(const ParamSpec& spec, const std::string& raw, ArgValue& out, std::string& err);

/**
 * @brief Bind an envelope's arguments to @p spec's schema.
 * @return false with a Python-style message in @p err on any argument error.
 */
bool bind_arguments(const CommandSpec& spec, const Envelope& env, BoundArgs& out, std::string& err);

/// One line: `name(param:type[=default], ...) - summary`
std::string describe(const CommandSpec& spec);

class CommandRegistry {
public:
    CommandRegistry() = default;

    /// Throws std::invalid_argument on an empty, duplicate, or encoder-less entry.
    explicit CommandRegistry(std::vector<CommandSpec> commands);

    const CommandSpec* resolve(const std::string& name) const;

    const std::vector<CommandSpec>& commands() const { return commands_; }
    std::size_t size() const { return commands_.size(); }

private:
    std::vector<CommandSpec>           commands_;
    std::map<std::string, std::size_t> index_;
};

using DateSource = std::function<CalendarDate()>;

/// Today's date in local time.
CalendarDate local_today();

/// Registry for the pixel display. @p today supplies set_clock_mode's default date.
CommandRegistry make_pixel_registry(DateSource today = local_today);

} // namespace pixelbridge
