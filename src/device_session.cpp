// ============================================================================
// device_session.cpp: implementation for device_session.hpp
// ============================================================================

#include "pixelbridge/device_session.hpp"
#include "pixelbridge/log.hpp"

namespace pixelbridge {

const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting:   return "connecting";
        case SessionState::Connected:    return "connected";
        case SessionState::Lost:         return "lost";
    }
    return "?";
}

std::shared_ptr<DeviceSession> DeviceSession::create(std::string address,
                                                     LinkFactory factory,
                                                     Scheduler& scheduler,
                                                     RetryPolicy policy,
                                                     std::string characteristic) {
    return std::shared_ptr<DeviceSession>(
        new DeviceSession(std::move(address), std::move(factory), scheduler,
                          policy, std::move(characteristic)));
}

DeviceSession::DeviceSession(std::string address, LinkFactory factory, Scheduler& scheduler,
                             RetryPolicy policy, std::string characteristic)
    : address_(std::move(address)),
      factory_(std::move(factory)),
      scheduler_(scheduler),
      policy_(policy),
      characteristic_(std::move(characteristic)) {}

DeviceSession::~DeviceSession() {
    release();
}

void DeviceSession::async_acquire(AcquireHandler done) {
    if (state_ == SessionState::Connected && link_ && link_->is_connected()) {
        scheduler_.post([done] { done(AcquireResult::Connected); });
        return;
    }

    // Fresh start: whatever link is left (lost, half-open) goes first.
    release();
    attempts_ = 0;
    state_ = SessionState::Connecting;
    attempt(1, generation_, std::move(done));
}

// ---------------------------------------------------------------------------
// attempt()
// ---------
// One connect try. Success ends the acquisition; failure either schedules
// the next try after retry_delay or, once max_retries is spent, reports
// Unavailable. A release() in the middle makes every pending step stale.
// ---------------------------------------------------------------------------
void DeviceSession::attempt(int n, uint64_t gen, AcquireHandler done) {
    attempts_ = n;
    link_ = factory_(address_);
    if (!link_) {
        log_error("ble_connect_failed", {{"addr", address_}, {"reason", "no_link"}});
        state_ = SessionState::Disconnected;
        scheduler_.post([done] { done(AcquireResult::Unavailable); });
        return;
    }

    log_debug("ble_connect_attempt", {{"addr", address_},
              {"attempt", std::to_string(n) + "/" + std::to_string(policy_.max_retries)}});

    auto self = shared_from_this();
    auto link = link_;
    link->async_connect([self, link, n, gen, done](bool connected, const std::string& err) {
        if (gen != self->generation_) {          // released meanwhile
            link->disconnect();
            done(AcquireResult::Unavailable);
            return;
        }

        if (connected && link->is_connected()) {
            self->state_ = SessionState::Connected;
            log_info("ble_connected", {{"addr", self->address_}, {"link", link->name()},
                     {"attempt", std::to_string(n) + "/" + std::to_string(self->policy_.max_retries)}});
            done(AcquireResult::Connected);
            return;
        }

        log_error("ble_connect_failed", {{"addr", self->address_},
                  {"attempt", std::to_string(n) + "/" + std::to_string(self->policy_.max_retries)},
                  {"reason", err.empty() ? "not_connected" : err}});
        link->disconnect();
        self->link_.reset();

        if (n >= self->policy_.max_retries) {
            self->state_ = SessionState::Disconnected;
            log_error("ble_unavailable", {{"addr", self->address_},
                      {"attempts", std::to_string(n)}});
            done(AcquireResult::Unavailable);
            return;
        }

        self->scheduler_.async_wait(self->policy_.retry_delay, [self, n, gen, done] {
            if (gen != self->generation_) {
                done(AcquireResult::Unavailable);
                return;
            }
            self->attempt(n + 1, gen, done);
        });
    });
}

void DeviceSession::async_write(const Bytes& payload, WriteHandler done) {
    if (state_ != SessionState::Connected || !link_ || !link_->is_connected()) {
        if (state_ == SessionState::Connected) {
            log_warn("ble_transport_lost", {{"addr", address_}, {"stage", "pre_write"}});
        }
        state_ = SessionState::Lost;
        scheduler_.post([done] { done(WriteResult::TransportLost, "not_connected"); });
        return;
    }
    log_debug("ble_write", {{"addr", address_}, {"bytes", std::to_string(payload.size())},
              {"data", to_hex(payload)}});
    auto self = shared_from_this();
    const uint64_t gen = generation_;
    link_->async_write(characteristic_, payload,
        [self, gen, done](LinkStatus st, const std::string& err) {
            switch (st) {
            case LinkStatus::Ok:
                done(WriteResult::Ok, {});
                return;
            case LinkStatus::Failed:
                // link still up; retrying on a fresh connection would hit the same wall
                log_error("ble_write_failed", {{"addr", self->address_}, {"reason", err}});
                done(WriteResult::Failed, err.empty() ? "write_failed" : err);
                return;
            case LinkStatus::Lost:
                break;
            }
            log_warn("ble_transport_lost", {{"addr", self->address_}, {"stage", "write"},
                     {"reason", err}});
            if (gen == self->generation_) self->state_ = SessionState::Lost;
            done(WriteResult::TransportLost, err);
        });
}

void DeviceSession::release() noexcept {
    ++generation_;
    if (link_) {
        link_->disconnect();
        link_.reset();
        log_debug("ble_released", {{"addr", address_}});
    }
    state_ = SessionState::Disconnected;
}

} // namespace pixelbridge
