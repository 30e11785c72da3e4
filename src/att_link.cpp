// ============================================================================
// att_link.cpp: implementation for att_link.hpp
// ============================================================================

#include "pixelbridge/att_link.hpp"
#include "pixelbridge/log.hpp"

#include <algorithm>                    // std::min/max for MTU and piece sizes
#include <cctype>                       // std::tolower for UUID keys
#include <cstdio>                       // std::snprintf for UUID formatting

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/system_error.hpp>

#include <bluetooth/bluetooth.h>        // bdaddr_t, str2ba, htobs, BDADDR_LE_*
#include <bluetooth/l2cap.h>            // sockaddr_l2, BTPROTO_L2CAP

namespace pixelbridge {

// ---------------------------------------------------------------------------
// ATT constants (Core Spec Vol 3 Part F). Only what this link uses.
// ---------------------------------------------------------------------------
static constexpr uint16_t ATT_CID              = 0x0004;
static constexpr uint16_t ATT_DEFAULT_MTU      = 23;
static constexpr std::size_t ATT_MAX_PDU       = 517;

static constexpr uint8_t OP_ERROR_RSP          = 0x01;
static constexpr uint8_t OP_MTU_REQ            = 0x02;
static constexpr uint8_t OP_MTU_RSP            = 0x03;
static constexpr uint8_t OP_READ_BY_TYPE_REQ   = 0x08;
static constexpr uint8_t OP_READ_BY_TYPE_RSP   = 0x09;
static constexpr uint8_t OP_HANDLE_VALUE_IND   = 0x1D;
static constexpr uint8_t OP_HANDLE_VALUE_CFM   = 0x1E;
static constexpr uint8_t OP_WRITE_CMD          = 0x52;

static constexpr uint16_t GATT_CHARACTERISTIC  = 0x2803;

using seq_packet = boost::asio::generic::seq_packet_protocol;

// ---------- UUID helpers ----------

std::string expand_uuid16(uint16_t short_uuid) {
    char buf[40];
    std::snprintf(buf, sizeof buf, "0000%04x-0000-1000-8000-00805f9b34fb", short_uuid);
    return buf;
}

std::string uuid128_from_le(const uint8_t* le) {
    // wire order is little-endian; text order is big-endian
    uint8_t be[16];
    for (int i = 0; i < 16; ++i) be[i] = le[15 - i];
    char buf[40];
    std::snprintf(buf, sizeof buf,
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  be[0], be[1], be[2], be[3], be[4], be[5], be[6], be[7],
                  be[8], be[9], be[10], be[11], be[12], be[13], be[14], be[15]);
    return buf;
}

static std::string lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

static std::string hex8(uint8_t v) {
    char buf[8];
    std::snprintf(buf, sizeof buf, "0x%02x", v);
    return buf;
}

// ============================================================================
// AttLink
// ============================================================================

AttLink::AttLink(boost::asio::io_context& io, Options opts)
    : io_(io), opts_(std::move(opts)), socket_(io), timer_(io), rx_(ATT_MAX_PDU) {}

AttLink::~AttLink() {
    disconnect();
}

// ---------------------------------------------------------------------------
// async_connect()
// ---------------
// Phases: open+bind → connect (timer-bounded) → MTU exchange → discovery.
// Any failure closes the socket and reports (false, reason).
// ---------------------------------------------------------------------------
void AttLink::async_connect(ConnectHandler done) {
    sockaddr_l2 remote{};
    remote.l2_family      = AF_BLUETOOTH;
    remote.l2_cid         = htobs(ATT_CID);
    remote.l2_bdaddr_type = opts_.random_address ? BDADDR_LE_RANDOM : BDADDR_LE_PUBLIC;
    if (str2ba(opts_.address.c_str(), &remote.l2_bdaddr) < 0) {
        boost::asio::post(io_, [done] { done(false, "bad_address"); });
        return;
    }

    sockaddr_l2 local{};                  // zeroed bdaddr = any adapter
    local.l2_family      = AF_BLUETOOTH;
    local.l2_cid         = htobs(ATT_CID);
    local.l2_bdaddr_type = BDADDR_LE_PUBLIC;

    boost::system::error_code ec;
    socket_.open(seq_packet(AF_BLUETOOTH, BTPROTO_L2CAP), ec);
    if (!ec) socket_.bind(seq_packet::endpoint(&local, sizeof local, BTPROTO_L2CAP), ec);
    if (ec) {
        const std::string why = "socket: " + ec.message();
        disconnect();
        boost::asio::post(io_, [done, why] { done(false, why); });
        return;
    }

    auto self    = shared_from_this();
    auto settled = std::make_shared<bool>(false);

    timer_.expires_after(opts_.connect_timeout);
    timer_.async_wait([self, settled](const boost::system::error_code& tec) {
        // a queued expiry can outlive cancel(); settled tells it the connect is done
        if (tec || *settled) return;
        *settled = true;
        boost::system::error_code ignore;
        self->socket_.close(ignore);         // aborts the pending connect
    });

    socket_.async_connect(seq_packet::endpoint(&remote, sizeof remote, BTPROTO_L2CAP),
        [self, settled, done](const boost::system::error_code& cec) {
            const bool timed_out = *settled;
            *settled = true;
            self->timer_.cancel();
            if (cec || timed_out) {
                const std::string why = timed_out ? "connect_timeout" : cec.message();
                self->disconnect();
                done(false, why);
                return;
            }
            self->exchange_mtu(done);
        });
}

void AttLink::exchange_mtu(ConnectHandler done) {
    const uint16_t want = opts_.preferred_mtu;
    Pdu req{OP_MTU_REQ, (uint8_t)(want & 0xFF), (uint8_t)(want >> 8)};

    auto self = shared_from_this();
    transact(std::move(req), OP_MTU_RSP, [self, done, want](bool ok, const Pdu& rsp, const std::string& err) {
        if (!ok && rsp.empty()) {            // transport failure, not an ATT refusal
            self->disconnect();
            done(false, "mtu_exchange: " + err);
            return;
        }
        if (ok && rsp.size() >= 3) {
            const uint16_t server = (uint16_t)(rsp[1] | (rsp[2] << 8));
            self->mtu_ = std::max<uint16_t>(ATT_DEFAULT_MTU, std::min(want, server));
        }
        log_debug("ble_mtu", {{"addr", self->opts_.address}, {"mtu", std::to_string(self->mtu_)}});
        self->discover(0x0001, done);
    });
}

// ---------------------------------------------------------------------------
// discover()
// ----------
// Read By Type <<Characteristic>> from @p start to 0xFFFF, one response at a
// time. An ATT error (normally Attribute Not Found) ends the walk.
// ---------------------------------------------------------------------------
void AttLink::discover(uint16_t start, ConnectHandler done) {
    Pdu req{OP_READ_BY_TYPE_REQ,
            (uint8_t)(start & 0xFF), (uint8_t)(start >> 8),
            0xFF, 0xFF,
            (uint8_t)(GATT_CHARACTERISTIC & 0xFF), (uint8_t)(GATT_CHARACTERISTIC >> 8)};

    auto self = shared_from_this();
    transact(std::move(req), OP_READ_BY_TYPE_RSP,
        [self, start, done](bool ok, const Pdu& rsp, const std::string& err) {
            auto finish = [self, done] {
                if (self->handles_.empty()) {
                    self->disconnect();
                    done(false, "no_characteristics");
                    return;
                }
                self->connected_ = true;
                log_debug("ble_discovered", {{"addr", self->opts_.address},
                          {"characteristics", std::to_string(self->handles_.size())}});
                self->monitor();
                done(true, {});
            };

            if (!ok) {
                if (rsp.empty()) {
                    self->disconnect();
                    done(false, "discovery: " + err);
                    return;
                }
                finish();                    // end of attribute range
                return;
            }

            const std::size_t len = rsp.size() >= 2 ? rsp[1] : 0;
            if (len != 7 && len != 21) {
                self->disconnect();
                done(false, "discovery: bad record length " + std::to_string(len));
                return;
            }

            uint16_t last = start;
            for (std::size_t i = 2; i + len <= rsp.size(); i += len) {
                const uint16_t decl  = (uint16_t)(rsp[i] | (rsp[i + 1] << 8));
                const uint16_t value = (uint16_t)(rsp[i + 3] | (rsp[i + 4] << 8));
                const std::string uuid = (len == 7)
                    ? expand_uuid16((uint16_t)(rsp[i + 5] | (rsp[i + 6] << 8)))
                    : uuid128_from_le(&rsp[i + 5]);
                self->handles_[uuid] = value;
                last = decl;
            }

            if (last == 0xFFFF || last < start) {
                finish();
                return;
            }
            self->discover((uint16_t)(last + 1), done);
        });
}

// ---------------------------------------------------------------------------
// transact()
// ----------
// Send one request and wait for @p expect (or an Error Response to it).
// ok=false with an empty rsp means the bearer failed; ok=false with the
// error PDU in rsp means the peer refused.
// ---------------------------------------------------------------------------
void AttLink::transact(Pdu request, uint8_t expect, ResponseHandler done) {
    auto self    = shared_from_this();
    auto settled = std::make_shared<bool>(false);
    auto req     = std::make_shared<Pdu>(std::move(request));

    timer_.expires_after(opts_.connect_timeout);
    timer_.async_wait([self, settled, done](const boost::system::error_code& ec) {
        if (ec || *settled) return;
        *settled = true;
        boost::system::error_code ignore;
        self->socket_.close(ignore);
        done(false, {}, "att_timeout");
    });

    socket_.async_send(boost::asio::buffer(*req), 0,
        [self, req, settled, expect, done](const boost::system::error_code& ec, std::size_t) {
            if (*settled) return;
            if (ec) {
                *settled = true;
                self->timer_.cancel();
                done(false, {}, ec.message());
                return;
            }
            self->await_response((*req)[0], expect, settled, done);
        });
}

void AttLink::await_response(uint8_t req_opcode, uint8_t expect, std::shared_ptr<bool> settled,
                             ResponseHandler done) {
    auto self = shared_from_this();
    socket_.async_receive(boost::asio::buffer(rx_), rx_flags_,
        [self, req_opcode, expect, settled, done](const boost::system::error_code& ec, std::size_t n) {
            if (*settled) return;
            if (ec || n == 0) {
                *settled = true;
                self->timer_.cancel();
                done(false, {}, ec ? ec.message() : "peer_closed");
                return;
            }

            Pdu pdu(self->rx_.begin(), self->rx_.begin() + (std::ptrdiff_t)n);
            const uint8_t op = pdu[0];

            if (op == expect) {
                *settled = true;
                self->timer_.cancel();
                done(true, pdu, {});
                return;
            }
            if (op == OP_ERROR_RSP && pdu.size() >= 5 && pdu[1] == req_opcode) {
                *settled = true;
                self->timer_.cancel();
                done(false, pdu, "att_error:" + hex8(pdu[4]));
                return;
            }
            if (op == OP_HANDLE_VALUE_IND) {
                auto cfm = std::make_shared<Pdu>(Pdu{OP_HANDLE_VALUE_CFM});
                self->socket_.async_send(boost::asio::buffer(*cfm), 0,
                    [cfm](const boost::system::error_code&, std::size_t) {});
            }
            // notification or unrelated PDU: keep waiting
            self->await_response(req_opcode, expect, settled, done);
        });
}

// Background receive while connected; its only job is noticing the link drop.
void AttLink::monitor() {
    auto self = shared_from_this();
    socket_.async_receive(boost::asio::buffer(rx_), rx_flags_,
        [self](const boost::system::error_code& ec, std::size_t n) {
            if (ec || n == 0) {
                if (self->connected_)
                    log_warn("ble_link_down", {{"addr", self->opts_.address},
                             {"reason", ec ? ec.message() : "peer_closed"}});
                self->connected_ = false;
                return;
            }
            if (self->rx_[0] == OP_HANDLE_VALUE_IND) {
                auto cfm = std::make_shared<Pdu>(Pdu{OP_HANDLE_VALUE_CFM});
                self->socket_.async_send(boost::asio::buffer(*cfm), 0,
                    [cfm](const boost::system::error_code&, std::size_t) {});
            }
            self->monitor();
        });
}

void AttLink::async_write(const std::string& characteristic_uuid,
                          const std::vector<uint8_t>& data,
                          WriteHandler done) {
    if (!connected_) {
        boost::asio::post(io_, [done] { done(LinkStatus::Lost, "not_connected"); });
        return;
    }
    auto it = handles_.find(lower(characteristic_uuid));
    if (it == handles_.end()) {
        const std::string why = "characteristic_not_found:" + characteristic_uuid;
        boost::asio::post(io_, [done, why] { done(LinkStatus::Failed, why); });
        return;
    }
    if (data.empty()) {
        boost::asio::post(io_, [done] { done(LinkStatus::Ok, {}); });
        return;
    }
    write_piece(std::make_shared<Pdu>(data), 0, it->second, std::move(done));
}

void AttLink::write_piece(std::shared_ptr<Pdu> payload, std::size_t offset, uint16_t handle,
                          WriteHandler done) {
    const std::size_t room = (std::size_t)mtu_ - 3;
    const std::size_t n    = std::min(room, payload->size() - offset);

    auto pdu = std::make_shared<Pdu>();
    pdu->reserve(3 + n);
    pdu->push_back(OP_WRITE_CMD);
    pdu->push_back((uint8_t)(handle & 0xFF));
    pdu->push_back((uint8_t)(handle >> 8));
    pdu->insert(pdu->end(), payload->begin() + (std::ptrdiff_t)offset,
                payload->begin() + (std::ptrdiff_t)(offset + n));

    auto self = shared_from_this();
    socket_.async_send(boost::asio::buffer(*pdu), 0,
        [self, pdu, payload, offset, n, handle, done](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                self->connected_ = false;
                done(LinkStatus::Lost, ec.message());
                return;
            }
            if (!self->connected_) {
                done(LinkStatus::Lost, "link_down");
                return;
            }
            const std::size_t next = offset + n;
            if (next >= payload->size()) {
                done(LinkStatus::Ok, {});
                return;
            }
            self->write_piece(payload, next, handle, done);
        });
}

void AttLink::disconnect() noexcept {
    connected_ = false;
    try {
        timer_.cancel();
    } catch (const boost::system::system_error&) {
        // timer is going away with us anyway
    }
    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.shutdown(boost::asio::socket_base::shutdown_both, ec);
        socket_.close(ec);
    }
}

LinkFactory make_att_link_factory(boost::asio::io_context& io, AttLink::Options base) {
    return [&io, base](const std::string& address) -> std::shared_ptr<BleLink> {
        AttLink::Options o = base;
        o.address = address;
        return std::make_shared<AttLink>(io, o);
    };
}

} // namespace pixelbridge
