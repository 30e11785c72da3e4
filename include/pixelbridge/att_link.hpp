#pragma once
/**
 * @file att_link.hpp
 * @brief Linux BLE link: BlueZ L2CAP socket on the ATT fixed channel, driven by Asio.
 *
 * @details
 * PURPOSE
 * -------
 * Talks GATT to the display without a daemon round-trip: the kernel's LE
 * L2CAP socket gives us the ATT bearer directly and Asio lets every step be
 * an ordinary async operation on the bridge's single event loop.
 *
 * CONNECT SEQUENCE
 * ----------------
 *   1) open AF_BLUETOOTH/SOCK_SEQPACKET/BTPROTO_L2CAP, bind CID 4 (ATT)
 *   2) connect to the peer, bounded by connect_timeout
 *   3) MTU exchange (keep 23 if the peer refuses)
 *   4) characteristic discovery: Read By Type 0x2803 over 0x0001..0xFFFF,
 *      remembering value handle per UUID
 *   5) start a background receive; any error on it marks the link lost
 *
 * WRITES
 * ------
 * ATT Write Command (0x52) to the value handle, the payload cut into
 * MTU-3 byte pieces sent back to back. A socket error or an unknown UUID
 * completes with a non-Ok status.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - The process needs CAP_NET_RAW/CAP_NET_ADMIN or membership in the
 *   `bluetooth` group, same as any raw BlueZ client.
 * - If bluetoothd is already connected to the device the kernel refuses a
 *   second LE link; disconnect it with bluetoothctl first.
 */

#include "pixelbridge/ble_link.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/generic/seq_packet_protocol.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace pixelbridge {

class AttLink : public BleLink, public std::enable_shared_from_this<AttLink> {
public:
    struct Options {
        std::string               address;
        bool                      random_address{false};
        std::chrono::milliseconds connect_timeout{10000};
        uint16_t                  preferred_mtu{247};
    };

    AttLink(boost::asio::io_context& io, Options opts);
    ~AttLink() override;

    void async_connect(ConnectHandler done) override;
    void async_write(const std::string& characteristic_uuid,
                     const std::vector<uint8_t>& data,
                     WriteHandler done) override;
    void disconnect() noexcept override;
    bool is_connected() const override { return connected_; }
    const char* name() const override { return "bluez-att"; }

    uint16_t mtu() const { return mtu_; }

private:
    using Pdu = std::vector<uint8_t>;
    using ResponseHandler = std::function<void(bool ok, const Pdu& rsp, const std::string& err)>;

    void exchange_mtu(ConnectHandler done);
    void discover(uint16_t start, ConnectHandler done);
    void transact(Pdu request, uint8_t expect, ResponseHandler done);
    void await_response(uint8_t req_opcode, uint8_t expect, std::shared_ptr<bool> settled,
                        ResponseHandler done);
    void monitor();
    void write_piece(std::shared_ptr<Pdu> payload, std::size_t offset, uint16_t handle,
                     WriteHandler done);

    boost::asio::io_context&                          io_;
    Options                                           opts_;
    boost::asio::generic::seq_packet_protocol::socket socket_;
    boost::asio::steady_timer                         timer_;

    std::map<std::string, uint16_t>             handles_;   // lowercase uuid -> value handle
    uint16_t                                    mtu_{23};
    bool                                        connected_{false};
    Pdu                                         rx_;
    boost::asio::socket_base::message_flags     rx_flags_{};
};

/// Factory for DeviceSession: one fresh AttLink per connect attempt.
LinkFactory make_att_link_factory(boost::asio::io_context& io, AttLink::Options base);

/// `0000xxxx-0000-1000-8000-00805f9b34fb` for a 16-bit SIG UUID.
std::string expand_uuid16(uint16_t short_uuid);

/// 16 little-endian bytes as they appear on the ATT wire → canonical lowercase string.
std::string uuid128_from_le(const uint8_t* le);

} // namespace pixelbridge
