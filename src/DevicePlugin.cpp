#include "DevicePlugin.h"

#include <utility>

#include "Config.h"
#include "system/Log.h"

namespace qcardio {

EnginePlugin::EnginePlugin(DeviceProfile profile, DeviceDescriptor device, BleTransport& transport, Clock& clock)
    : profile_(std::move(profile)), device_(std::move(device)), link_(transport, clock, profile_.annotations) {
    if (!profile_.batteryUuid.empty()) {
        link_.setKeepAliveUuid(profile_.batteryUuid);
    }
}

ErrorCode EnginePlugin::discover(GattCatalog& out) {
    const ErrorCode rc = link_.ensureSession(device_);
    if (!isOk(rc)) {
        return rc;
    }
    out = link_.registry().catalog();
    return ErrorCode::Ok;
}

ErrorCode EnginePlugin::read(const std::string& uuid, Bytes& out) {
    const ErrorCode rc = link_.ensureSession(device_);
    if (!isOk(rc)) {
        return rc;
    }
    return link_.read(uuid, out);
}

ErrorCode EnginePlugin::write(const std::string& uuid, const Bytes& value) {
    const ErrorCode rc = link_.ensureSession(device_);
    if (!isOk(rc)) {
        return rc;
    }
    return link_.write(uuid, value);
}

ErrorCode EnginePlugin::measure(const ProgressCallback& progress, Record& out) {
    if (!profile_.supportsMeasurement) {
        return ErrorCode::NotSupported;
    }
    cancelRequested_.store(false);

    ErrorCode rc = link_.ensureSession(device_);
    if (!isOk(rc)) {
        return rc;
    }

    Clock& clock = link_.clock();
    MeasurementStateMachine machine(link_.registry(), link_.dispatcher(), link_.transport(), clock);
    rc = machine.start(profile_.channels, device_.measureTimeoutMs);
    if (!isOk(rc)) {
        return rc;
    }
    QC_LOG("MEASURE", "measurement started on %s", device_.address.c_str());

    link_.setLinkLostListener([&machine](uint32_t) { machine.abort(AbortReason::LinkLost, "link dropped"); });

    auto flushProgress = [&machine, &progress]() {
        for (const auto& event : machine.drainProgress()) {
            if (progress) {
                progress(event);
            }
        }
    };

    while (!machine.terminal()) {
        link_.service();
        if (!machine.terminal() && !link_.connection().connected()) {
            machine.abort(AbortReason::LinkLost, "not connected");
        }
        if (!machine.terminal() && cancelRequested_.exchange(false)) {
            machine.abort(AbortReason::UserCancelled, "cancel requested");
        }
        machine.evaluateTimeouts();
        flushProgress();
        if (!machine.terminal()) {
            clock.sleepMs(ENGINE_SERVICE_INTERVAL_MS);
        }
    }
    flushProgress();
    link_.setLinkLostListener(nullptr);

    ResultAssembler assembler(clock, [this](uint8_t& percent) { return readBatteryLevel(percent); });
    out = assembler.assemble(device_, machine);
    QC_LOG("MEASURE", "record %s %s", outcomeLabel(out.outcome),
           out.outcome == Outcome::Aborted ? abortReasonLabel(out.reason) : "");
    return ErrorCode::Ok;
}

ErrorCode EnginePlugin::getBattery(uint8_t& percent) {
    const ErrorCode rc = link_.ensureSession(device_);
    if (!isOk(rc)) {
        return rc;
    }
    return readBatteryLevel(percent);
}

ErrorCode EnginePlugin::readBatteryLevel(uint8_t& percent) {
    if (profile_.batteryUuid.empty()) {
        return ErrorCode::NotSupported;
    }
    Bytes raw;
    const ErrorCode rc = link_.read(profile_.batteryUuid, raw);
    if (!isOk(rc)) {
        return rc;
    }
    return decodeBatteryLevel(raw.data(), raw.size(), percent);
}

ErrorCode EnginePlugin::getDeviceInfo(FieldList& out) {
    out.clear();
    const ErrorCode rc = link_.ensureSession(device_);
    if (!isOk(rc)) {
        return rc;
    }
    for (const auto& field : profile_.infoFields) {
        if (link_.registry().find(field.uuid) == nullptr) {
            QC_LOG("GATT", "device info field %s not present", field.key);
            continue;
        }
        Bytes raw;
        const ErrorCode readRc = link_.read(field.uuid, raw);
        if (!isOk(readRc)) {
            return readRc;
        }
        out.push_back({field.key, decodeInfoString(raw)});
    }
    return ErrorCode::Ok;
}

ErrorCode EnginePlugin::getFeatures(FeatureSupport& out) {
    if (profile_.featureUuid.empty()) {
        return ErrorCode::NotSupported;
    }
    const ErrorCode rc = link_.ensureSession(device_);
    if (!isOk(rc)) {
        return rc;
    }
    Bytes raw;
    const ErrorCode readRc = link_.read(profile_.featureUuid, raw);
    if (!isOk(readRc)) {
        return readRc;
    }
    return decodeBloodPressureFeature(raw.data(), raw.size(), out);
}

}  // namespace qcardio
