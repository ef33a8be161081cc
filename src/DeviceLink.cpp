#include "DeviceLink.h"

#include <utility>

#include "system/Log.h"

namespace qcardio {

DeviceLink::DeviceLink(BleTransport& transport, Clock& clock, std::vector<AnnotationEntry> vendorAnnotations)
    : transport_(transport),
      clock_(clock),
      registry_(std::move(vendorAnnotations)),
      dispatcher_(transport),
      connection_(transport, clock),
      keepAliveUuid_(sigUuid(0x2A19)) {
    transport_.setNotifyCallback([this](const std::string& uuid, const uint8_t* data, size_t length) {
        dispatcher_.onTransportFrame(uuid, data, length);
    });
    connection_.setSessionClosedCallback([this](uint32_t) {
        registry_.invalidate();
        dispatcher_.reset();
    });
    connection_.setLinkLostCallback([this](uint32_t sessionId, int) {
        if (linkLost_) {
            linkLost_(sessionId);
        }
    });
}

DeviceLink::~DeviceLink() {
    transport_.setNotifyCallback(nullptr);
    transport_.setDisconnectCallback(nullptr);
}

ErrorCode DeviceLink::ensureSession(const DeviceDescriptor& device) {
    if (connection_.connected() && !sameDevice(connection_.device(), device)) {
        close();
    }

    RetryPolicy policy;
    policy.retries = device.connectRetries;
    policy.backoffMs = device.retryBackoffMs;
    connection_.setRetryPolicy(policy);
    connection_.setKeepAlive(device.pollIntervalMs, [this]() { return keepAlive(); });

    ErrorCode rc = connection_.connect(device, device.scanTimeoutMs);
    if (!isOk(rc)) {
        return rc;
    }
    if (registry_.valid() && registry_.sessionId() == connection_.sessionId()) {
        return ErrorCode::Ok;
    }

    rc = registry_.discover(transport_, connection_.sessionId());
    if (!isOk(rc)) {
        close();
    }
    return rc;
}

void DeviceLink::close() {
    connection_.disconnect();
}

void DeviceLink::service() {
    connection_.service();
    dispatcher_.pump();
}

ErrorCode DeviceLink::read(const std::string& uuid, Bytes& out) {
    if (!connection_.connected()) {
        return ErrorCode::NotConnected;
    }
    const Characteristic* characteristic = registry_.find(uuid);
    if (characteristic == nullptr) {
        return ErrorCode::UnknownCharacteristic;
    }
    if (!characteristic->canRead()) {
        QC_WARN("GATT", "%s is not readable", characteristic->uuid.c_str());
        return ErrorCode::ReadFailed;
    }
    const ErrorCode rc = transport_.read(characteristic->uuid, out);
    if (isOk(rc) && out.empty()) {
        // NimBLE reports a failed ATT read as an empty value.
        QC_WARN("GATT", "%s read returned no data", characteristic->uuid.c_str());
        return ErrorCode::ReadFailed;
    }
    return rc;
}

ErrorCode DeviceLink::write(const std::string& uuid, const Bytes& value) {
    if (!connection_.connected()) {
        return ErrorCode::NotConnected;
    }
    const Characteristic* characteristic = registry_.find(uuid);
    if (characteristic == nullptr) {
        return ErrorCode::UnknownCharacteristic;
    }
    if (!characteristic->canWrite()) {
        QC_WARN("GATT", "%s is not writable", characteristic->uuid.c_str());
        return ErrorCode::WriteRejected;
    }
    const bool withResponse = (characteristic->properties & char_props::kWrite) != 0;
    return transport_.write(characteristic->uuid, value, withResponse);
}

ErrorCode DeviceLink::keepAlive() {
    if (registry_.find(keepAliveUuid_) == nullptr) {
        return ErrorCode::Ok;
    }
    Bytes ignored;
    return read(keepAliveUuid_, ignored);
}

}  // namespace qcardio
