#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "DeviceTypes.h"
#include "Errors.h"

namespace qcardio {

namespace char_props {
constexpr uint8_t kRead = 0x01;
constexpr uint8_t kWrite = 0x02;
constexpr uint8_t kWriteNoResponse = 0x04;
constexpr uint8_t kNotify = 0x08;
constexpr uint8_t kIndicate = 0x10;
}  // namespace char_props

struct RemoteCharacteristic {
    std::string uuid;
    uint16_t handle = 0;
    uint8_t properties = 0;
};

struct RemoteService {
    std::string uuid;
    std::vector<RemoteCharacteristic> characteristics;
};

/**
 * @brief GATT client adapter for one peer device.
 *
 * All calls except the two emit helpers are made from the foreground loop.
 * Implementations may invoke the notify and disconnect callbacks from the
 * BLE host task; receivers must only enqueue work there.
 *
 * Error contract:
 *  - scanFor: Ok, NotFound (scan finished without seeing the address),
 *    Timeout (scan did not finish within the budget).
 *  - connect: Ok, LinkError.
 *  - read/write/setNotifications: Ok, NotConnected, UnknownCharacteristic,
 *    ReadFailed (read), WriteRejected (write or CCCD write).
 */
class BleTransport {
public:
    using NotifyCallback = std::function<void(const std::string& uuid, const uint8_t* data, size_t length)>;
    using DisconnectCallback = std::function<void(int reason)>;

    virtual ~BleTransport() = default;

    virtual ErrorCode scanFor(const std::string& address, const std::string& adapter, uint32_t timeoutMs) = 0;
    virtual ErrorCode connect(const std::string& address, uint32_t timeoutMs) = 0;
    virtual void disconnect() = 0;
    virtual bool connected() const = 0;

    virtual ErrorCode discoverServices(std::vector<RemoteService>& out) = 0;
    virtual ErrorCode read(const std::string& uuid, Bytes& out) = 0;
    virtual ErrorCode write(const std::string& uuid, const Bytes& value, bool withResponse) = 0;
    virtual ErrorCode setNotifications(const std::string& uuid, bool enable) = 0;

    void setNotifyCallback(NotifyCallback cb) { notify_ = std::move(cb); }
    void setDisconnectCallback(DisconnectCallback cb) { disconnected_ = std::move(cb); }

protected:
    void emitNotification(const std::string& uuid, const uint8_t* data, size_t length) {
        if (notify_) {
            notify_(uuid, data, length);
        }
    }

    void emitDisconnect(int reason) {
        if (disconnected_) {
            disconnected_(reason);
        }
    }

private:
    NotifyCallback notify_;
    DisconnectCallback disconnected_;
};

}  // namespace qcardio
