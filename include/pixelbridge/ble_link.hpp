#pragma once
/**
 * @file ble_link.hpp
 * @brief Minimal BLE link interface the device session relies on.
 *
 * Contract:
 *  - async_connect() runs exactly one connection attempt and reports whether
 *    the link is now usable. It does not retry; DeviceSession owns that policy.
 *  - async_write() writes @p data to the characteristic named by UUID.
 *    LinkStatus::Lost means the link is gone and must be rebuilt.
 *  - disconnect() is best-effort, idempotent and never throws.
 *  - is_connected() may flip to false at any time when the peer goes away.
 *
 * Implementations complete handlers on the event loop, never inline from the
 * initiating call, and keep themselves alive (shared_from_this) while an
 * operation is in flight.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pixelbridge {

enum class LinkStatus : uint8_t { Ok = 0, Failed = 1, Lost = 2 };

class BleLink {
public:
    using ConnectHandler = std::function<void(bool connected, const std::string& err)>;
    using WriteHandler   = std::function<void(LinkStatus status, const std::string& err)>;

    virtual ~BleLink() = default;

    virtual void async_connect(ConnectHandler done) = 0;
    virtual void async_write(const std::string& characteristic_uuid,
                             const std::vector<uint8_t>& data,
                             WriteHandler done) = 0;
    virtual void disconnect() noexcept = 0;
    virtual bool is_connected() const = 0;
    virtual const char* name() const = 0;
};

/// Makes a fresh, unconnected link for a device address (one per attempt).
using LinkFactory = std::function<std::shared_ptr<BleLink>(const std::string& address)>;

} // namespace pixelbridge
