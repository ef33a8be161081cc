#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "BleTransport.h"
#include "Clock.h"
#include "DeviceLink.h"
#include "DeviceTypes.h"
#include "Errors.h"
#include "GattRegistry.h"
#include "MeasurementStateMachine.h"
#include "ResultAssembler.h"
#include "ValueCodec.h"

namespace qcardio {

using ProgressCallback = std::function<void(const ProgressEvent& event)>;

/**
 * @brief Capability set every supported device type exposes.
 *
 * Connect errors and WriteRejected come back as the returned ErrorCode. A
 * measurement that started always resolves to a Record (Completed or Aborted)
 * and returns Ok.
 */
class DevicePlugin {
public:
    virtual ~DevicePlugin() = default;

    virtual const char* typeId() const = 0;
    virtual const DeviceDescriptor& device() const = 0;

    virtual ErrorCode discover(GattCatalog& out) = 0;
    virtual ErrorCode read(const std::string& uuid, Bytes& out) = 0;
    virtual ErrorCode write(const std::string& uuid, const Bytes& value) = 0;
    virtual ErrorCode measure(const ProgressCallback& progress, Record& out) = 0;
    virtual ErrorCode getBattery(uint8_t& percent) = 0;
    virtual ErrorCode getDeviceInfo(FieldList& out) = 0;
    virtual ErrorCode getFeatures(FeatureSupport& out) = 0;

    // Safe from any task; picked up by the running measurement loop.
    virtual void requestCancel() = 0;

    // Foreground pump between commands (keep-alive, link-drop handling).
    virtual void service() = 0;
    virtual void close() = 0;
};

struct InfoField {
    const char* key;
    const char* uuid;
};

// Everything that differs between device types. The engine itself is shared.
struct DeviceProfile {
    const char* typeId = "";
    const char* displayName = "";
    std::vector<AnnotationEntry> annotations;
    std::string batteryUuid;
    std::string featureUuid;
    std::vector<InfoField> infoFields;
    bool supportsMeasurement = false;
    MeasurementChannels channels;
};

class EnginePlugin : public DevicePlugin {
public:
    EnginePlugin(DeviceProfile profile, DeviceDescriptor device, BleTransport& transport, Clock& clock);

    const char* typeId() const override { return profile_.typeId; }
    const DeviceDescriptor& device() const override { return device_; }

    ErrorCode discover(GattCatalog& out) override;
    ErrorCode read(const std::string& uuid, Bytes& out) override;
    ErrorCode write(const std::string& uuid, const Bytes& value) override;
    ErrorCode measure(const ProgressCallback& progress, Record& out) override;
    ErrorCode getBattery(uint8_t& percent) override;
    ErrorCode getDeviceInfo(FieldList& out) override;
    ErrorCode getFeatures(FeatureSupport& out) override;

    void requestCancel() override { cancelRequested_.store(true); }
    void service() override { link_.service(); }
    void close() override { link_.close(); }

    const DeviceProfile& profile() const { return profile_; }
    DeviceLink& link() { return link_; }

private:
    ErrorCode readBatteryLevel(uint8_t& percent);

    DeviceProfile profile_;
    DeviceDescriptor device_;
    DeviceLink link_;
    std::atomic<bool> cancelRequested_{false};
};

}  // namespace qcardio
