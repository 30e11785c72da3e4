// ============================================================================
// envelope.cpp: implementation for envelope.hpp
// ============================================================================

#include "pixelbridge/envelope.hpp"

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace pixelbridge {

std::string normalize_keyword_key(std::string key) {
    for (auto& c : key)
        if (c == '-') c = '_';
    return key;
}

void split_params(const std::vector<std::string>& params, Envelope& out) {
    out.positional.clear();
    out.keyword.clear();

    for (const auto& p : params) {
        const auto eq = p.find('=');
        if (eq == std::string::npos) {
            out.positional.push_back(p);
            continue;
        }
        // first '=' only; later ones belong to the value
        out.keyword[normalize_keyword_key(p.substr(0, eq))] = p.substr(eq + 1);
    }
}

Envelope make_envelope(const std::string& name, const std::vector<std::string>& params) {
    Envelope env;
    env.name = name;
    split_params(params, env);
    return env;
}

bool parse_envelope(const std::string& text, Envelope& out, std::string& err) {
    try {
        const json j = json::parse(text);
        if (!j.is_object()) {
            err = "request must be a JSON object";
            return false;
        }

        Envelope env;
        auto cmd = j.find("command");
        if (cmd != j.end() && cmd->is_string())
            env.name = cmd->get<std::string>();
        // otherwise leave empty: resolves to "Unknown command" downstream

        std::vector<std::string> params;
        auto ps = j.find("params");
        if (ps != j.end() && !ps->is_null()) {
            if (!ps->is_array()) {
                env.params_error = "params must be a list of strings";
            } else {
                params.reserve(ps->size());
                for (const auto& p : *ps) {
                    if (!p.is_string()) {
                        env.params_error = "params entries must be strings";
                        params.clear();
                        break;
                    }
                    params.push_back(p.get<std::string>());
                }
            }
        }

        split_params(params, env);
        out = std::move(env);
        return true;
    } catch (const json::exception& e) {
        err = e.what();
        return false;
    }
}

} // namespace pixelbridge
