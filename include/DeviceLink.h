#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "BleTransport.h"
#include "Clock.h"
#include "ConnectionManager.h"
#include "DeviceTypes.h"
#include "Errors.h"
#include "GattRegistry.h"
#include "NotificationDispatcher.h"

namespace qcardio {

/**
 * @brief The single actor behind one device connection.
 *
 * Composes the connection manager, the GATT catalog and the notification
 * dispatcher over one transport. service() is the foreground pump: it applies
 * link drops, runs keep-alive and delivers queued notifications.
 */
class DeviceLink {
public:
    using LinkLostListener = std::function<void(uint32_t sessionId)>;

    DeviceLink(BleTransport& transport, Clock& clock, std::vector<AnnotationEntry> vendorAnnotations = {});
    ~DeviceLink();

    DeviceLink(const DeviceLink&) = delete;
    DeviceLink& operator=(const DeviceLink&) = delete;

    // Connects (or reuses the open session) and makes sure the catalog
    // belongs to the current session.
    ErrorCode ensureSession(const DeviceDescriptor& device);
    void close();
    void service();

    ErrorCode read(const std::string& uuid, Bytes& out);
    ErrorCode write(const std::string& uuid, const Bytes& value);

    void setKeepAliveUuid(const std::string& uuid) { keepAliveUuid_ = normalizeUuid(uuid); }
    void setLinkLostListener(LinkLostListener listener) { linkLost_ = std::move(listener); }

    BleTransport& transport() { return transport_; }
    Clock& clock() { return clock_; }
    ConnectionManager& connection() { return connection_; }
    const ConnectionManager& connection() const { return connection_; }
    GattRegistry& registry() { return registry_; }
    const GattRegistry& registry() const { return registry_; }
    NotificationDispatcher& dispatcher() { return dispatcher_; }

private:
    ErrorCode keepAlive();

    BleTransport& transport_;
    Clock& clock_;
    GattRegistry registry_;
    NotificationDispatcher dispatcher_;
    ConnectionManager connection_;
    std::string keepAliveUuid_;
    LinkLostListener linkLost_;
};

}  // namespace qcardio
