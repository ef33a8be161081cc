#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

#include "BleTransport.h"
#include "Clock.h"
#include "DeviceTypes.h"
#include "Errors.h"

namespace qcardio {

enum class ConnectionState : uint8_t { Disconnected, Scanning, Connecting, Connected };

const char* connectionStateLabel(ConnectionState state);

// Extra attempts after the first one fails; only NotFound, Timeout and
// LinkError are retried.
struct RetryPolicy {
    uint8_t retries = 0;
    uint32_t backoffMs = 0;
};

/**
 * @brief Owns the link to one device address.
 *
 * The manager is the only writer of the connection state. A link drop
 * reported by the transport (possibly from the BLE host task) is parked and
 * applied by the next service() call: the session is torn down, keep-alive
 * cancelled and LinkLost handed to the caller. It never reconnects on its own.
 */
class ConnectionManager {
public:
    using LinkLostCallback = std::function<void(uint32_t sessionId, int reason)>;
    using SessionClosedCallback = std::function<void(uint32_t sessionId)>;
    using KeepAliveProbe = std::function<ErrorCode()>;

    ConnectionManager(BleTransport& transport, Clock& clock);

    ErrorCode connect(const DeviceDescriptor& device, uint32_t timeoutMs);
    void disconnect();
    void service();

    void setRetryPolicy(const RetryPolicy& policy) { retry_ = policy; }
    const RetryPolicy& retryPolicy() const { return retry_; }

    // interval 0 disables keep-alive for the following sessions.
    void setKeepAlive(uint32_t intervalMs, KeepAliveProbe probe);

    void setLinkLostCallback(LinkLostCallback cb) { linkLost_ = std::move(cb); }
    void setSessionClosedCallback(SessionClosedCallback cb) { sessionClosed_ = std::move(cb); }

    ConnectionState state() const { return state_; }
    bool connected() const { return state_ == ConnectionState::Connected; }
    uint32_t sessionId() const { return sessionId_; }
    const DeviceDescriptor& device() const { return device_; }

    bool keepAliveScheduled() const { return keepAliveDueMs_ != 0; }
    uint64_t keepAliveDueMs() const { return keepAliveDueMs_; }
    uint32_t keepAliveCount() const { return keepAliveCount_; }

private:
    ErrorCode attempt(const DeviceDescriptor& device, uint32_t timeoutMs);
    void teardown(bool lost, int reason);
    void runKeepAlive(uint64_t nowMs);

    BleTransport& transport_;
    Clock& clock_;
    RetryPolicy retry_;

    ConnectionState state_ = ConnectionState::Disconnected;
    DeviceDescriptor device_;
    uint32_t sessionId_ = 0;
    uint32_t nextSessionId_ = 1;

    uint32_t keepAliveIntervalMs_ = 0;
    KeepAliveProbe keepAliveProbe_;
    uint64_t keepAliveDueMs_ = 0;
    uint32_t keepAliveCount_ = 0;

    std::atomic<bool> dropPending_{false};
    std::atomic<int> dropReason_{0};
    std::atomic<bool> closing_{false};

    LinkLostCallback linkLost_;
    SessionClosedCallback sessionClosed_;
};

}  // namespace qcardio
