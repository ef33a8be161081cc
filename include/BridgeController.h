#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

#include "BleTransport.h"
#include "Clock.h"
#include "DevicePlugin.h"
#include "DeviceTypes.h"
#include "Errors.h"
#include "proto/qcardio.pb.h"

namespace qcardio {

/**
 * @brief Boundary between the client link and the device plugin.
 *
 * acceptFrame() is called from the BLE host task: it decodes the command,
 * applies cancel immediately and queues everything else. service() runs the
 * queued commands on the foreground loop and reports every outcome as a
 * BridgeEvent through the send callback.
 */
class BridgeController {
public:
    using SendCallback = std::function<void(const com_qcardio_bridge_BridgeEvent&)>;

    BridgeController(BleTransport& transport, Clock& clock, SendCallback sendFn);

    // Replaces the active plugin; false when the type has no plugin. Scan
    // timeout and retry backoff are clamped to what the task watchdog allows.
    bool configure(const DeviceDescriptor& device);

    bool acceptFrame(const uint8_t* data, size_t length);
    void handleCommand(const com_qcardio_bridge_BridgeCommand& cmd);

    void requestCancel();
    void service();

    const DeviceDescriptor& device() const { return device_; }
    DevicePlugin* plugin() { return plugin_.get(); }
    size_t pendingCommands() const;

    void setSendCallback(SendCallback cb) { send_ = std::move(cb); }

private:
    void runMeasure();
    void runBattery();
    void runInfo();
    void runFeatures();
    void runDiscover();
    void runRead(const com_qcardio_bridge_ReadCommand& cmd);
    void runWrite(const com_qcardio_bridge_WriteCommand& cmd);
    void runConfigure(const com_qcardio_bridge_ConfigureCommand& cmd);
    void runSetTime(const com_qcardio_bridge_SetTimeCommand& cmd);

    void sendError(ErrorCode code, const char* context);
    void sendSettings();
    void emit(com_qcardio_bridge_BridgeEvent& event);

    BleTransport& transport_;
    Clock& clock_;
    SendCallback send_;
    DeviceDescriptor device_;
    std::unique_ptr<DevicePlugin> plugin_;

    mutable std::mutex pendingMutex_;
    std::deque<com_qcardio_bridge_BridgeCommand> pending_;
};

}  // namespace qcardio
