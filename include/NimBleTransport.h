#pragma once

#ifdef ARDUINO

#include <NimBLEDevice.h>

#include <string>
#include <vector>

#include "BleTransport.h"

namespace qcardio {

// GATT client side of the bridge: one NimBLEClient towards the health device.
class NimBleTransport : public BleTransport, public NimBLEClientCallbacks {
public:
    NimBleTransport() = default;
    ~NimBleTransport() override;

    ErrorCode scanFor(const std::string& address, const std::string& adapter, uint32_t timeoutMs) override;
    ErrorCode connect(const std::string& address, uint32_t timeoutMs) override;
    void disconnect() override;
    bool connected() const override;

    ErrorCode discoverServices(std::vector<RemoteService>& out) override;
    ErrorCode read(const std::string& uuid, Bytes& out) override;
    ErrorCode write(const std::string& uuid, const Bytes& value, bool withResponse) override;
    ErrorCode setNotifications(const std::string& uuid, bool enable) override;

    void onConnect(NimBLEClient* client) override;
    void onDisconnect(NimBLEClient* client, int reason) override;

private:
    NimBLERemoteCharacteristic* findCharacteristic(const std::string& uuid);

    NimBLEClient* client_ = nullptr;
    NimBLEAddress found_;
    bool haveFound_ = false;
};

}  // namespace qcardio

#endif  // ARDUINO
