#include "ConnectionManager.h"

#include "system/Log.h"

namespace qcardio {

namespace {

bool retryable(ErrorCode code) {
    return code == ErrorCode::NotFound || code == ErrorCode::Timeout || code == ErrorCode::LinkError;
}

}  // namespace

const char* connectionStateLabel(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Scanning:
            return "scanning";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
    }
    return "disconnected";
}

ConnectionManager::ConnectionManager(BleTransport& transport, Clock& clock) : transport_(transport), clock_(clock) {
    transport_.setDisconnectCallback([this](int reason) {
        if (closing_.exchange(false)) {
            return;
        }
        dropReason_.store(reason);
        dropPending_.store(true);
    });
}

void ConnectionManager::setKeepAlive(uint32_t intervalMs, KeepAliveProbe probe) {
    keepAliveIntervalMs_ = intervalMs;
    keepAliveProbe_ = std::move(probe);
}

ErrorCode ConnectionManager::connect(const DeviceDescriptor& device, uint32_t timeoutMs) {
    if (connected()) {
        if (sameDevice(device, device_)) {
            return ErrorCode::Ok;
        }
        disconnect();
    }

    const uint32_t attempts = static_cast<uint32_t>(retry_.retries) + 1;
    ErrorCode rc = ErrorCode::NotFound;
    for (uint32_t i = 0; i < attempts; ++i) {
        if (i > 0) {
            QC_LOG("CONN", "retry %u/%u in %u ms", static_cast<unsigned>(i), static_cast<unsigned>(retry_.retries),
                   static_cast<unsigned>(retry_.backoffMs));
            clock_.sleepMs(retry_.backoffMs);
        }
        rc = attempt(device, timeoutMs);
        if (isOk(rc) || !retryable(rc)) {
            break;
        }
    }
    return rc;
}

ErrorCode ConnectionManager::attempt(const DeviceDescriptor& device, uint32_t timeoutMs) {
    state_ = ConnectionState::Scanning;
    QC_LOG("CONN", "scanning for %s (%u ms)", device.address.c_str(), static_cast<unsigned>(timeoutMs));
    ErrorCode rc = transport_.scanFor(device.address, device.adapter, timeoutMs);
    if (!isOk(rc)) {
        state_ = ConnectionState::Disconnected;
        QC_WARN("CONN", "scan failed: %s", errorLabel(rc));
        return rc;
    }

    state_ = ConnectionState::Connecting;
    closing_.store(false);
    dropPending_.store(false);
    rc = transport_.connect(device.address, timeoutMs);
    if (!isOk(rc)) {
        state_ = ConnectionState::Disconnected;
        QC_WARN("CONN", "connect failed: %s", errorLabel(rc));
        return rc;
    }

    device_ = device;
    sessionId_ = nextSessionId_++;
    state_ = ConnectionState::Connected;
    keepAliveCount_ = 0;
    keepAliveDueMs_ = 0;
    if (keepAliveIntervalMs_ > 0 && keepAliveProbe_) {
        keepAliveDueMs_ = clock_.nowMs() + keepAliveIntervalMs_;
    }
    QC_LOG("CONN", "connected %s session=%u", device.address.c_str(), static_cast<unsigned>(sessionId_));
    return ErrorCode::Ok;
}

void ConnectionManager::disconnect() {
    if (state_ != ConnectionState::Connected) {
        return;
    }
    closing_.store(true);
    transport_.disconnect();
    dropPending_.store(false);
    teardown(false, 0);
}

void ConnectionManager::service() {
    if (dropPending_.exchange(false) && connected()) {
        teardown(true, dropReason_.load());
        return;
    }
    if (connected() && keepAliveDueMs_ != 0) {
        const uint64_t now = clock_.nowMs();
        if (now >= keepAliveDueMs_) {
            runKeepAlive(now);
        }
    }
}

void ConnectionManager::runKeepAlive(uint64_t nowMs) {
    keepAliveDueMs_ = nowMs + keepAliveIntervalMs_;
    ++keepAliveCount_;
    const ErrorCode rc = keepAliveProbe_();
    if (isOk(rc)) {
        return;
    }
    QC_WARN("CONN", "keep-alive read failed: %s", errorLabel(rc));
    if (rc == ErrorCode::NotConnected || !transport_.connected()) {
        teardown(true, 0);
    }
}

void ConnectionManager::teardown(bool lost, int reason) {
    const uint32_t closed = sessionId_;
    state_ = ConnectionState::Disconnected;
    keepAliveDueMs_ = 0;
    if (lost) {
        QC_WARN("CONN", "link lost session=%u reason=%d", static_cast<unsigned>(closed), reason);
    } else {
        QC_LOG("CONN", "disconnected session=%u", static_cast<unsigned>(closed));
    }
    if (sessionClosed_) {
        sessionClosed_(closed);
    }
    if (lost && linkLost_) {
        linkLost_(closed, reason);
    }
}

}  // namespace qcardio
