#pragma once

#include <deque>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "BleTransport.h"
#include "GattRegistry.h"

namespace qcardio {
namespace test {

constexpr const char* kVendorServiceUuid = "583cb5b3-875d-40ed-9098-c39eb0c19830";
constexpr const char* kControlPointUuid = "583cb5b3-875d-40ed-9098-c39eb0c1983d";

// Scripted peer. Everything is keyed by normalized UUID.
class FakeTransport : public BleTransport {
public:
    struct WriteRecord {
        std::string uuid;
        Bytes value;
        bool withResponse = false;
    };

    ErrorCode scanFor(const std::string& address, const std::string& adapter, uint32_t timeoutMs) override {
        (void)timeoutMs;
        ++scanCalls;
        lastAddress = address;
        lastAdapter = adapter;
        return next(scanResults);
    }

    ErrorCode connect(const std::string& address, uint32_t timeoutMs) override {
        (void)address;
        (void)timeoutMs;
        ++connectCalls;
        const ErrorCode rc = next(connectResults);
        linkUp = isOk(rc);
        return rc;
    }

    // Like NimBLE, an intentional disconnect is reported through the callback too.
    void disconnect() override {
        ++disconnectCalls;
        if (linkUp) {
            linkUp = false;
            emitDisconnect(0x16);
        }
    }

    bool connected() const override { return linkUp; }

    ErrorCode discoverServices(std::vector<RemoteService>& out) override {
        ++discoverCalls;
        if (!linkUp) {
            return ErrorCode::NotConnected;
        }
        if (!isOk(discoverResult)) {
            return discoverResult;
        }
        out = services;
        return ErrorCode::Ok;
    }

    ErrorCode read(const std::string& uuid, Bytes& out) override {
        const std::string key = normalizeUuid(uuid);
        reads.push_back(key);
        if (!linkUp) {
            return ErrorCode::NotConnected;
        }
        auto err = readErrors.find(key);
        if (err != readErrors.end()) {
            return err->second;
        }
        auto it = values.find(key);
        if (it == values.end()) {
            return ErrorCode::UnknownCharacteristic;
        }
        out = it->second;
        return ErrorCode::Ok;
    }

    ErrorCode write(const std::string& uuid, const Bytes& value, bool withResponse) override {
        const std::string key = normalizeUuid(uuid);
        if (!linkUp) {
            return ErrorCode::NotConnected;
        }
        auto err = writeErrors.find(key);
        if (err != writeErrors.end()) {
            return err->second;
        }
        writes.push_back({key, value, withResponse});
        return ErrorCode::Ok;
    }

    ErrorCode setNotifications(const std::string& uuid, bool enable) override {
        const std::string key = normalizeUuid(uuid);
        if (!linkUp) {
            return ErrorCode::NotConnected;
        }
        auto err = notifyErrors.find(key);
        if (enable && err != notifyErrors.end()) {
            return err->second;
        }
        notificationChanges.push_back({key, enable});
        return ErrorCode::Ok;
    }

    void notify(const std::string& uuid, const Bytes& data) {
        emitNotification(normalizeUuid(uuid), data.data(), data.size());
    }

    void dropLink(int reason) {
        linkUp = false;
        emitDisconnect(reason);
    }

    void setValue(const std::string& uuid, const Bytes& value) { values[normalizeUuid(uuid)] = value; }

    size_t enabledCount(const std::string& uuid) const { return changeCount(uuid, true); }
    size_t disabledCount(const std::string& uuid) const { return changeCount(uuid, false); }

    std::deque<ErrorCode> scanResults;
    std::deque<ErrorCode> connectResults;
    ErrorCode discoverResult = ErrorCode::Ok;
    std::vector<RemoteService> services;
    std::map<std::string, Bytes> values;
    std::map<std::string, ErrorCode> readErrors;
    std::map<std::string, ErrorCode> writeErrors;
    std::map<std::string, ErrorCode> notifyErrors;

    std::vector<WriteRecord> writes;
    std::vector<std::string> reads;
    std::vector<std::pair<std::string, bool>> notificationChanges;
    std::string lastAddress;
    std::string lastAdapter;
    int scanCalls = 0;
    int connectCalls = 0;
    int disconnectCalls = 0;
    int discoverCalls = 0;
    bool linkUp = false;

private:
    static ErrorCode next(std::deque<ErrorCode>& script) {
        if (script.empty()) {
            return ErrorCode::Ok;
        }
        const ErrorCode rc = script.front();
        script.pop_front();
        return rc;
    }

    size_t changeCount(const std::string& uuid, bool enable) const {
        const std::string key = normalizeUuid(uuid);
        size_t n = 0;
        for (const auto& change : notificationChanges) {
            if (change.first == key && change.second == enable) {
                ++n;
            }
        }
        return n;
    }
};

inline RemoteCharacteristic remoteChar(const std::string& uuid, uint16_t handle, uint8_t properties) {
    RemoteCharacteristic chr;
    chr.uuid = uuid;
    chr.handle = handle;
    chr.properties = properties;
    return chr;
}

// GATT table of a QardioArm as the cuff reports it.
inline std::vector<RemoteService> qardioArmServices() {
    using namespace char_props;
    std::vector<RemoteService> services(5);
    services[0].uuid = "1800";
    services[0].characteristics = {remoteChar("2a00", 3, kRead), remoteChar("2a01", 5, kRead)};
    services[1].uuid = "180a";
    services[1].characteristics = {
        remoteChar("2a29", 10, kRead),
        remoteChar("2a24", 12, kRead),
        remoteChar("2a25", 14, kRead),
        remoteChar("2a26", 16, kRead),
    };
    services[2].uuid = "180f";
    services[2].characteristics = {remoteChar("2a19", 20, kRead | kNotify)};
    services[3].uuid = "1810";
    services[3].characteristics = {
        remoteChar("2a35", 30, kIndicate),
        remoteChar("2a49", 33, kRead),
    };
    services[4].uuid = kVendorServiceUuid;
    services[4].characteristics = {remoteChar(kControlPointUuid, 40, kWrite | kNotify)};
    return services;
}

// Peer with the Arm table and Battery Level / Feature / Device Information values.
inline void loadQardioArm(FakeTransport& transport) {
    transport.services = qardioArmServices();
    transport.setValue("2a19", {0x45});
    transport.setValue("2a49", {0x03, 0x00});
    transport.setValue("2a29", {'Q', 'a', 'r', 'd', 'i', 'o', 0x00});
    transport.setValue("2a24", {'A', '1', '0', '0'});
    transport.setValue("2a25", {' ', 'S', 'N', '4', '2', ' '});
    transport.setValue("2a26", {'1', '.', '2'});
    transport.setValue("2a00", {'Q', 'A'});
}

inline Bytes finalMeasurement120over80() {
    // flags: mmHg, measurement status present
    return {0x10, 0x78, 0x00, 0x50, 0x00, 0x5D, 0x00, 0x00, 0x00};
}

}  // namespace test
}  // namespace qcardio
