#ifdef ARDUINO

#include "NimBleTransport.h"

#include <Arduino.h>

#include <cctype>

#include "GattRegistry.h"
#include "system/Log.h"

namespace qcardio {

namespace {

bool sameAddress(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

uint8_t propertiesOf(const NimBLERemoteCharacteristic* chr) {
    uint8_t props = 0;
    if (chr->canRead()) {
        props |= char_props::kRead;
    }
    if (chr->canWrite()) {
        props |= char_props::kWrite;
    }
    if (chr->canWriteNoResponse()) {
        props |= char_props::kWriteNoResponse;
    }
    if (chr->canNotify()) {
        props |= char_props::kNotify;
    }
    if (chr->canIndicate()) {
        props |= char_props::kIndicate;
    }
    return props;
}

}  // namespace

NimBleTransport::~NimBleTransport() {
    if (client_ != nullptr) {
        NimBLEDevice::deleteClient(client_);
        client_ = nullptr;
    }
}

ErrorCode NimBleTransport::scanFor(const std::string& address, const std::string& adapter, uint32_t timeoutMs) {
    (void)adapter;
    haveFound_ = false;
    NimBLEScan* scan = NimBLEDevice::getScan();
    scan->setActiveScan(true);
    scan->setInterval(100);
    scan->setWindow(99);

    const uint32_t started = millis();
    NimBLEScanResults results = scan->getResults(timeoutMs, false);
    for (int i = 0; i < results.getCount(); ++i) {
        const NimBLEAdvertisedDevice* device = results.getDevice(i);
        if (device != nullptr && sameAddress(device->getAddress().toString(), address)) {
            found_ = device->getAddress();
            haveFound_ = true;
            break;
        }
    }
    scan->clearResults();

    if (haveFound_) {
        QC_LOG("BLE", "found %s after %lu ms", address.c_str(), static_cast<unsigned long>(millis() - started));
        return ErrorCode::Ok;
    }
    if (millis() - started > timeoutMs + 1000) {
        return ErrorCode::Timeout;
    }
    return ErrorCode::NotFound;
}

ErrorCode NimBleTransport::connect(const std::string& address, uint32_t timeoutMs) {
    if (!haveFound_) {
        found_ = NimBLEAddress(address, BLE_ADDR_PUBLIC);
    }
    if (client_ == nullptr) {
        client_ = NimBLEDevice::createClient();
        if (client_ == nullptr) {
            return ErrorCode::LinkError;
        }
        client_->setClientCallbacks(this, false);
    }
    client_->setConnectTimeout(timeoutMs);
    if (!client_->connect(found_)) {
        QC_WARN("BLE", "connect to %s rejected", address.c_str());
        return ErrorCode::LinkError;
    }
    return ErrorCode::Ok;
}

void NimBleTransport::disconnect() {
    if (client_ != nullptr && client_->isConnected()) {
        client_->disconnect();
    }
}

bool NimBleTransport::connected() const {
    return client_ != nullptr && client_->isConnected();
}

ErrorCode NimBleTransport::discoverServices(std::vector<RemoteService>& out) {
    out.clear();
    if (!connected()) {
        return ErrorCode::NotConnected;
    }
    const std::vector<NimBLERemoteService*>& services = client_->getServices(true);
    for (NimBLERemoteService* svc : services) {
        RemoteService service;
        service.uuid = svc->getUUID().toString();
        const std::vector<NimBLERemoteCharacteristic*>& chars = svc->getCharacteristics(true);
        for (NimBLERemoteCharacteristic* chr : chars) {
            RemoteCharacteristic characteristic;
            characteristic.uuid = chr->getUUID().toString();
            characteristic.handle = chr->getHandle();
            characteristic.properties = propertiesOf(chr);
            service.characteristics.push_back(characteristic);
        }
        out.push_back(service);
    }
    return ErrorCode::Ok;
}

NimBLERemoteCharacteristic* NimBleTransport::findCharacteristic(const std::string& uuid) {
    if (client_ == nullptr) {
        return nullptr;
    }
    const std::string wanted = normalizeUuid(uuid);
    for (NimBLERemoteService* svc : client_->getServices(false)) {
        for (NimBLERemoteCharacteristic* chr : svc->getCharacteristics(false)) {
            if (normalizeUuid(chr->getUUID().toString()) == wanted) {
                return chr;
            }
        }
    }
    return nullptr;
}

ErrorCode NimBleTransport::read(const std::string& uuid, Bytes& out) {
    if (!connected()) {
        return ErrorCode::NotConnected;
    }
    NimBLERemoteCharacteristic* chr = findCharacteristic(uuid);
    if (chr == nullptr) {
        return ErrorCode::UnknownCharacteristic;
    }
    if (!chr->canRead()) {
        return ErrorCode::ReadFailed;
    }
    NimBLEAttValue value = chr->readValue();
    if (!connected()) {
        return ErrorCode::NotConnected;
    }
    if (value.size() == 0) {
        QC_WARN("BLE", "read of %s failed", uuid.c_str());
        return ErrorCode::ReadFailed;
    }
    out.assign(value.data(), value.data() + value.size());
    return ErrorCode::Ok;
}

ErrorCode NimBleTransport::write(const std::string& uuid, const Bytes& value, bool withResponse) {
    if (!connected()) {
        return ErrorCode::NotConnected;
    }
    NimBLERemoteCharacteristic* chr = findCharacteristic(uuid);
    if (chr == nullptr) {
        return ErrorCode::UnknownCharacteristic;
    }
    if (!chr->writeValue(value.data(), value.size(), withResponse)) {
        return ErrorCode::WriteRejected;
    }
    return ErrorCode::Ok;
}

ErrorCode NimBleTransport::setNotifications(const std::string& uuid, bool enable) {
    if (!connected()) {
        return ErrorCode::NotConnected;
    }
    NimBLERemoteCharacteristic* chr = findCharacteristic(uuid);
    if (chr == nullptr) {
        return ErrorCode::UnknownCharacteristic;
    }
    if (!enable) {
        return chr->unsubscribe(true) ? ErrorCode::Ok : ErrorCode::WriteRejected;
    }
    const std::string key = normalizeUuid(uuid);
    const bool notify = chr->canNotify();
    const bool ok = chr->subscribe(notify, [this, key](NimBLERemoteCharacteristic*, uint8_t* data, size_t length, bool) {
        emitNotification(key, data, length);
    });
    return ok ? ErrorCode::Ok : ErrorCode::WriteRejected;
}

void NimBleTransport::onConnect(NimBLEClient* client) {
    QC_LOG("BLE", "link up %s", client->getPeerAddress().toString().c_str());
}

void NimBleTransport::onDisconnect(NimBLEClient* client, int reason) {
    QC_LOG("BLE", "link down %s reason=0x%x", client->getPeerAddress().toString().c_str(), reason);
    emitDisconnect(reason);
}

}  // namespace qcardio

#endif  // ARDUINO
