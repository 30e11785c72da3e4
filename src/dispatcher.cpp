// -----------------------------------------------------------------------------
// Implementation for dispatcher.hpp
// -----------------------------------------------------------------------------

#include "pixelbridge/dispatcher.hpp"
#include "pixelbridge/log.hpp"

#include <exception>
#include <nlohmann/json.hpp>

namespace pixelbridge {

std::string to_json(const CommandResult& r) {
    nlohmann::ordered_json j;   // keep "status" first on the wire
    if (r.ok) {
        j["status"]  = "success";
        j["command"] = r.command;
    } else {
        j["status"]  = "error";
        j["message"] = r.message;
    }
    // invalid UTF-8 from a client must not abort the reply
    return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

bool Dispatcher::encode(const Envelope& env, Bytes& out, CommandResult& failure) const {
    const CommandSpec* spec = registry_.resolve(env.name);
    if (!spec) {
        failure = CommandResult::error("Unknown command");
        return false;
    }
    if (!env.params_error.empty()) {
        failure = CommandResult::error(env.params_error);
        return false;
    }

    BoundArgs args;
    std::string err;
    if (!bind_arguments(*spec, env, args, err)) {
        failure = CommandResult::error(err);
        return false;
    }

    // Encoders report through bool+err; anything thrown is still contained here.
    try {
        Bytes payload;
        if (!spec->encode(args, payload, err)) {
            failure = CommandResult::error(err.empty() ? "encoder failed" : err);
            return false;
        }
        out = std::move(payload);
        return true;
    } catch (const std::exception& e) {
        failure = CommandResult::error(e.what());
        return false;
    }
}

void Dispatcher::async_dispatch(const Envelope& env,
                                const std::shared_ptr<DeviceSession>& session,
                                Scheduler& scheduler,
                                Handler done) const {
    Bytes payload;
    CommandResult failure;
    if (!encode(env, payload, failure)) {
        log_debug("command_rejected", {{"command", env.name}, {"reason", failure.message}});
        scheduler.post([done, failure] { done(DispatchStatus::Done, failure); });
        return;
    }

    const std::string name = env.name;
    session->async_write(payload, [done, name](WriteResult wr, const std::string& reason) {
        if (wr == WriteResult::TransportLost) {
            done(DispatchStatus::TransportLost, CommandResult::error("BLE connection lost"));
            return;
        }
        if (wr == WriteResult::Failed) {
            log_warn("command_write_refused", {{"command", name}, {"reason", reason}});
            done(DispatchStatus::WriteFailed, CommandResult::error("BLE write failed: " + reason));
            return;
        }
        log_info("command_sent", {{"command", name}});
        done(DispatchStatus::Done, CommandResult::success(name));
    });
}

} // namespace pixelbridge
