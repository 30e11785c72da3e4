#pragma once
/**
 * @file envelope.hpp
 * @brief Inbound command requests → `Envelope` (name + positional + keyword args).
 *
 * @details
 * PURPOSE
 * -------
 * Both front doors of the bridge deliver the same thing: a command name and a
 * flat list of string parameters.
 *   - WebSocket clients send `{"command":"set_pixel","params":["3","4","color=ff0000"]}`.
 *   - The one-shot CLI gets `-c set_pixel 3 4 color=ff0000` from argv.
 *
 * This module turns either form into one `Envelope`, so the dispatcher never
 * cares where a request came from.
 *
 * CLASSIFICATION RULES
 * --------------------
 * - A token containing '=' is a keyword argument, split at the FIRST '='.
 *   The value is kept verbatim, further '=' included: `y=5=6` → {"y":"5=6"}.
 * - Every '-' in a keyword key becomes '_' (`pixel-x=1` → {"pixel_x":"1"}), so
 *   CLI-style spellings reach the encoder's parameter names.
 * - Everything else is positional, order preserved.
 * - No type coercion here. Values stay strings; the registry's parameter
 *   schema converts and validates them.
 * - A repeated keyword keeps the last value.
 *
 * JSON SIDE
 * ---------
 * - Missing or non-string `command` is not a parse failure: the name is left
 *   empty and the dispatcher answers "Unknown command".
 * - Missing `params` means no parameters.
 * - Anything else that is off (bad JSON, non-object, non-array params,
 *   non-string entries) is a parse failure with a readable reason.
 * - nlohmann::json exceptions never escape parse_envelope().
 */

#include <map>
#include <string>
#include <vector>

namespace pixelbridge {

struct Envelope {
    std::string                        name;
    std::vector<std::string>           positional;
    std::map<std::string, std::string> keyword;
    std::string                        params_error;   // set when "params" was unusable; name is still valid
};

/// `-` → `_` for every occurrence. Idempotent.
std::string normalize_keyword_key(std::string key);

/// Classify raw tokens into positional and keyword arguments of @p out.
/// Existing contents of @p out's argument containers are replaced.
void split_params(const std::vector<std::string>& params, Envelope& out);

/// Build an envelope from an already separated name + params (CLI path).
Envelope make_envelope(const std::string& name, const std::vector<std::string>& params);

/**
 * @brief Decode one request message.
 * @param text  Raw message text (expected to be a JSON object).
 * @param out   Filled on success.
 * @param err   Human-readable reason on failure.
 * @return true on success. Never throws.
 *
 * A malformed "params" does not fail the parse: the command name is kept and
 * the reason goes to Envelope::params_error, so an unknown name is still
 * reported as unknown first.
 */
bool parse_envelope(const std::string& text, Envelope& out, std::string& err);

} // namespace pixelbridge
