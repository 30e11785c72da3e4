// ============================================================================
// session_loop.cpp: implementation for session_loop.hpp
// ============================================================================

#include "pixelbridge/session_loop.hpp"
#include "pixelbridge/envelope.hpp"
#include "pixelbridge/log.hpp"

#include <exception>
#include <ostream>

namespace pixelbridge {

const char* to_string(LoopState s) {
    switch (s) {
        case LoopState::Idle:         return "idle";
        case LoopState::Acquiring:    return "acquiring";
        case LoopState::Receiving:    return "receiving";
        case LoopState::Dispatching:  return "dispatching";
        case LoopState::Reconnecting: return "reconnecting";
        case LoopState::Finished:     return "finished";
    }
    return "?";
}

// ============================================================================
// ClientSession
// ============================================================================

std::shared_ptr<ClientSession> ClientSession::create(std::shared_ptr<MessageChannel> channel,
                                                     std::shared_ptr<DeviceSession> device,
                                                     const Dispatcher& dispatcher,
                                                     Scheduler& scheduler,
                                                     int max_recoveries,
                                                     FinishHandler on_finish) {
    return std::shared_ptr<ClientSession>(
        new ClientSession(std::move(channel), std::move(device), dispatcher, scheduler,
                          max_recoveries, std::move(on_finish)));
}

ClientSession::ClientSession(std::shared_ptr<MessageChannel> channel,
                             std::shared_ptr<DeviceSession> device,
                             const Dispatcher& dispatcher, Scheduler& scheduler,
                             int max_recoveries, FinishHandler on_finish)
    : channel_(std::move(channel)),
      device_(std::move(device)),
      dispatcher_(dispatcher),
      scheduler_(scheduler),
      max_recoveries_(max_recoveries),
      on_finish_(std::move(on_finish)) {}

void ClientSession::start() {
    state_ = LoopState::Acquiring;
    auto self = shared_from_this();
    device_->async_acquire([self](AcquireResult r) {
        if (self->state_ == LoopState::Finished) return;
        if (r == AcquireResult::Unavailable) {
            self->respond_and_finish(CommandResult::error("Device unavailable"), "device_unavailable");
            return;
        }
        self->receive_next();
    });
}

void ClientSession::stop() {
    finish("shutdown");
}

void ClientSession::receive_next() {
    state_ = LoopState::Receiving;
    auto self = shared_from_this();
    channel_->async_receive([self](ChannelStatus st, std::string msg) {
        if (self->state_ == LoopState::Finished) return;
        if (st != ChannelStatus::Ok) {
            self->finish(st == ChannelStatus::Closed ? "peer_closed" : "channel_error");
            return;
        }
        self->handle_message(msg);
    });
}

// ---------------------------------------------------------------------------
// handle_message()
// ----------------
// Everything that can go wrong with the request itself ends up as an error
// reply, never as the end of the loop.
// ---------------------------------------------------------------------------
void ClientSession::handle_message(const std::string& text) {
    state_ = LoopState::Dispatching;
    try {
        Envelope env;
        std::string err;
        if (!parse_envelope(text, env, err)) {
            log_debug("request_parse_failed", {{"peer", channel_->peer()}, {"reason", err}});
            respond(CommandResult::error(err));
            return;
        }
        dispatch(env);
    } catch (const std::exception& e) {
        respond(CommandResult::error(e.what()));
    }
}

void ClientSession::dispatch(const Envelope& env) {
    state_ = LoopState::Dispatching;
    auto self = shared_from_this();
    dispatcher_.async_dispatch(env, device_, scheduler_,
        [self, env](DispatchStatus st, const CommandResult& result) {
            if (self->state_ == LoopState::Finished) return;
            if (st == DispatchStatus::TransportLost) {
                self->recover(env);
                return;
            }
            if (result.ok) self->recoveries_ = 0;
            self->respond(result);
        });
}

// ---------------------------------------------------------------------------
// recover()
// ---------
// Drop the dead link, reacquire from scratch, then replay the envelope that
// was in flight. Bounded by max_recoveries consecutive cycles.
// ---------------------------------------------------------------------------
void ClientSession::recover(const Envelope& env) {
    ++recoveries_;
    if (recoveries_ > max_recoveries_) {
        log_error("ble_recovery_exhausted", {{"peer", channel_->peer()},
                  {"recoveries", std::to_string(recoveries_ - 1)},
                  {"cap", std::to_string(max_recoveries_)}});
        respond_and_finish(CommandResult::error("BLE connection lost"), "recovery_exhausted");
        return;
    }

    state_ = LoopState::Reconnecting;
    log_warn("ble_reconnecting", {{"peer", channel_->peer()}, {"command", env.name},
             {"cycle", std::to_string(recoveries_) + "/" + std::to_string(max_recoveries_)}});

    device_->release();
    auto self = shared_from_this();
    device_->async_acquire([self, env](AcquireResult r) {
        if (self->state_ == LoopState::Finished) return;
        if (r == AcquireResult::Unavailable) {
            self->respond_and_finish(CommandResult::error("Device unavailable"), "reconnect_failed");
            return;
        }
        self->dispatch(env);   // replay
    });
}

void ClientSession::respond(const CommandResult& result) {
    ++handled_;
    auto self = shared_from_this();
    channel_->async_send(to_json(result), [self](ChannelStatus st) {
        if (self->state_ == LoopState::Finished) return;
        if (st != ChannelStatus::Ok) {
            self->finish("send_failed");
            return;
        }
        self->receive_next();
    });
}

void ClientSession::respond_and_finish(const CommandResult& result, const std::string& reason) {
    ++handled_;
    auto self = shared_from_this();
    channel_->async_send(to_json(result), [self, reason](ChannelStatus) {
        self->finish(reason);
    });
}

void ClientSession::finish(const std::string& reason) {
    if (state_ == LoopState::Finished) return;
    const LoopState was = state_;
    state_ = LoopState::Finished;

    device_->release();
    channel_->close();
    log_info("client_closed", {{"peer", channel_->peer()}, {"reason", reason},
             {"while", to_string(was)}, {"replies", std::to_string(handled_)}});

    if (on_finish_) on_finish_(reason);
}

// ============================================================================
// OneShot
// ============================================================================

static std::string quoted(const std::string& s) {
    std::string q = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') q += '\\';
        q += c;
    }
    return q + "\"";
}

std::shared_ptr<OneShot> OneShot::create(std::shared_ptr<DeviceSession> device,
                                         const Dispatcher& dispatcher, Scheduler& scheduler,
                                         std::ostream& out, std::ostream& err) {
    return std::shared_ptr<OneShot>(new OneShot(std::move(device), dispatcher, scheduler, out, err));
}

OneShot::OneShot(std::shared_ptr<DeviceSession> device, const Dispatcher& dispatcher,
                 Scheduler& scheduler, std::ostream& out, std::ostream& err)
    : device_(std::move(device)), dispatcher_(dispatcher), scheduler_(scheduler),
      out_(out), err_(err) {}

void OneShot::run(const Envelope& env, std::function<void(int)> done) {
    auto self = shared_from_this();
    device_->async_acquire([self, env, done](AcquireResult r) {
        if (r == AcquireResult::Unavailable) {
            self->err_ << "status=error reason=device_unavailable addr=" << self->device_->address()
                       << " attempts=" << self->device_->last_attempts() << "\n";
            done(EXIT_UNAVAILABLE);
            return;
        }

        self->dispatcher_.async_dispatch(env, self->device_, self->scheduler_,
            [self, env, done](DispatchStatus st, const CommandResult& result) {
                self->device_->release();   // single command; always let go

                if (st != DispatchStatus::Done) {
                    self->err_ << "status=error command=" << env.name
                               << " message=" << quoted(result.message) << "\n";
                    done(EXIT_UNAVAILABLE);
                    return;
                }
                if (result.ok) {
                    self->out_ << "status=ok command=" << result.command << "\n";
                    done(EXIT_OK);
                    return;
                }
                self->err_ << "status=error command=" << (env.name.empty() ? "-" : env.name)
                           << " message=" << quoted(result.message) << "\n";
                done(EXIT_REJECTED);
            });
    });
}

} // namespace pixelbridge
