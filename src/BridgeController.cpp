#include "BridgeController.h"

#include <algorithm>
#include <cstring>
#include <string>

#include "Config.h"
#include "PersistentConfig.h"
#include "PluginRegistry.h"
#include "RecordCodec.h"
#include "system/Log.h"

namespace qcardio {

namespace {

uint32_t clampScanTimeout(uint32_t ms) {
    return std::min<uint32_t>(ms, MAX_SCAN_TIMEOUT_MS);
}

uint32_t clampRetryBackoff(uint32_t ms) {
    return std::min<uint32_t>(ms, MAX_RETRY_BACKOFF_MS);
}

}  // namespace

BridgeController::BridgeController(BleTransport& transport, Clock& clock, SendCallback sendFn)
    : transport_(transport), clock_(clock), send_(std::move(sendFn)) {}

bool BridgeController::configure(const DeviceDescriptor& device) {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    if (plugin_) {
        plugin_->close();
        plugin_.reset();
    }
    device_ = device;
    device_.scanTimeoutMs = clampScanTimeout(device.scanTimeoutMs);
    device_.retryBackoffMs = clampRetryBackoff(device.retryBackoffMs);
    plugin_ = createPlugin(device_, transport_, clock_);
    if (!plugin_) {
        return false;
    }
    QC_LOG("BRIDGE", "device %s type=%s", device_.address.c_str(), plugin_->typeId());
    return true;
}

bool BridgeController::acceptFrame(const uint8_t* data, size_t length) {
    const uint8_t* payload = nullptr;
    size_t payloadLength = 0;
    if (!unwrapFrame(data, length, payload, payloadLength)) {
        return false;
    }
    com_qcardio_bridge_BridgeCommand cmd;
    if (!decodeCommand(payload, payloadLength, cmd)) {
        return false;
    }
    if (cmd.which_command == com_qcardio_bridge_BridgeCommand_cancel_tag) {
        requestCancel();
        return true;
    }
    std::lock_guard<std::mutex> lock(pendingMutex_);
    pending_.push_back(cmd);
    return true;
}

void BridgeController::requestCancel() {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    if (plugin_) {
        QC_LOG("BRIDGE", "cancel requested");
        plugin_->requestCancel();
    }
}

size_t BridgeController::pendingCommands() const {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    return pending_.size();
}

void BridgeController::service() {
    for (;;) {
        com_qcardio_bridge_BridgeCommand cmd;
        {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            if (pending_.empty()) {
                break;
            }
            cmd = pending_.front();
            pending_.pop_front();
        }
        handleCommand(cmd);
    }
    if (plugin_) {
        plugin_->service();
    }
}

void BridgeController::handleCommand(const com_qcardio_bridge_BridgeCommand& cmd) {
    if (cmd.which_command == com_qcardio_bridge_BridgeCommand_configure_tag) {
        runConfigure(cmd.command.configure);
        return;
    }
    if (cmd.which_command == com_qcardio_bridge_BridgeCommand_set_time_tag) {
        runSetTime(cmd.command.set_time);
        return;
    }
    if (cmd.which_command == com_qcardio_bridge_BridgeCommand_cancel_tag) {
        requestCancel();
        return;
    }
    if (!plugin_) {
        sendError(ErrorCode::NotSupported, "no device configured");
        return;
    }

    switch (cmd.which_command) {
        case com_qcardio_bridge_BridgeCommand_measure_tag:
            runMeasure();
            break;
        case com_qcardio_bridge_BridgeCommand_battery_tag:
            runBattery();
            break;
        case com_qcardio_bridge_BridgeCommand_info_tag:
            runInfo();
            break;
        case com_qcardio_bridge_BridgeCommand_features_tag:
            runFeatures();
            break;
        case com_qcardio_bridge_BridgeCommand_discover_tag:
            runDiscover();
            break;
        case com_qcardio_bridge_BridgeCommand_read_tag:
            runRead(cmd.command.read);
            break;
        case com_qcardio_bridge_BridgeCommand_write_tag:
            runWrite(cmd.command.write);
            break;
        default:
            QC_WARN("BRIDGE", "unknown command tag %u", static_cast<unsigned>(cmd.which_command));
            break;
    }
}

void BridgeController::runMeasure() {
    Record record;
    const ErrorCode rc = plugin_->measure(
        [this](const ProgressEvent& progress) {
            com_qcardio_bridge_BridgeEvent evt = com_qcardio_bridge_BridgeEvent_init_default;
            evt.which_event = com_qcardio_bridge_BridgeEvent_progress_tag;
            toProto(progress, evt.event.progress);
            emit(evt);
        },
        record);
    if (!isOk(rc)) {
        sendError(rc, "measure");
        return;
    }
    com_qcardio_bridge_BridgeEvent evt = com_qcardio_bridge_BridgeEvent_init_default;
    evt.which_event = com_qcardio_bridge_BridgeEvent_record_tag;
    toProto(record, evt.event.record);
    emit(evt);
}

void BridgeController::runBattery() {
    uint8_t percent = 0;
    const ErrorCode rc = plugin_->getBattery(percent);
    if (!isOk(rc)) {
        sendError(rc, "battery");
        return;
    }
    com_qcardio_bridge_BridgeEvent evt = com_qcardio_bridge_BridgeEvent_init_default;
    evt.which_event = com_qcardio_bridge_BridgeEvent_battery_tag;
    evt.event.battery.percent = percent;
    emit(evt);
}

void BridgeController::runInfo() {
    FieldList fields;
    const ErrorCode rc = plugin_->getDeviceInfo(fields);
    if (!isOk(rc)) {
        sendError(rc, "info");
        return;
    }
    com_qcardio_bridge_BridgeEvent evt = com_qcardio_bridge_BridgeEvent_init_default;
    evt.which_event = com_qcardio_bridge_BridgeEvent_info_tag;
    toProto(fields, evt.event.info);
    emit(evt);
}

void BridgeController::runFeatures() {
    FeatureSupport features;
    const ErrorCode rc = plugin_->getFeatures(features);
    if (!isOk(rc)) {
        sendError(rc, "features");
        return;
    }
    com_qcardio_bridge_BridgeEvent evt = com_qcardio_bridge_BridgeEvent_init_default;
    evt.which_event = com_qcardio_bridge_BridgeEvent_features_tag;
    toProto(features, evt.event.features);
    emit(evt);
}

void BridgeController::runDiscover() {
    GattCatalog catalog;
    const ErrorCode rc = plugin_->discover(catalog);
    if (!isOk(rc)) {
        sendError(rc, "discover");
        return;
    }
    uint32_t total = 0;
    for (const auto& service : catalog) {
        total += static_cast<uint32_t>(service.characteristics.size());
    }
    uint32_t index = 0;
    for (const auto& service : catalog) {
        for (const auto& characteristic : service.characteristics) {
            com_qcardio_bridge_BridgeEvent evt = com_qcardio_bridge_BridgeEvent_init_default;
            evt.which_event = com_qcardio_bridge_BridgeEvent_catalog_entry_tag;
            auto& entry = evt.event.catalog_entry;
            entry.index = index++;
            entry.total = total;
            copyString(service.uuid, entry.service_uuid, sizeof(entry.service_uuid));
            copyString(service.annotation, entry.service_annotation, sizeof(entry.service_annotation));
            copyString(characteristic.uuid, entry.uuid, sizeof(entry.uuid));
            entry.handle = characteristic.handle;
            entry.properties = characteristic.properties;
            copyString(characteristic.annotation, entry.annotation, sizeof(entry.annotation));
            emit(evt);
        }
    }
}

void BridgeController::runRead(const com_qcardio_bridge_ReadCommand& cmd) {
    Bytes value;
    const ErrorCode rc = plugin_->read(cmd.uuid, value);
    if (!isOk(rc)) {
        sendError(rc, cmd.uuid);
        return;
    }
    com_qcardio_bridge_BridgeEvent evt = com_qcardio_bridge_BridgeEvent_init_default;
    evt.which_event = com_qcardio_bridge_BridgeEvent_read_result_tag;
    auto& result = evt.event.read_result;
    copyString(normalizeUuid(cmd.uuid), result.uuid, sizeof(result.uuid));
    const size_t n = std::min(value.size(), sizeof(result.value.bytes));
    if (n < value.size()) {
        QC_WARN("BRIDGE", "read value truncated from %u to %u bytes", static_cast<unsigned>(value.size()),
                static_cast<unsigned>(n));
    }
    std::memcpy(result.value.bytes, value.data(), n);
    result.value.size = static_cast<pb_size_t>(n);
    emit(evt);
}

void BridgeController::runWrite(const com_qcardio_bridge_WriteCommand& cmd) {
    const Bytes value(cmd.value.bytes, cmd.value.bytes + cmd.value.size);
    const ErrorCode rc = plugin_->write(cmd.uuid, value);
    if (!isOk(rc)) {
        sendError(rc, cmd.uuid);
        return;
    }
    com_qcardio_bridge_BridgeEvent evt = com_qcardio_bridge_BridgeEvent_init_default;
    evt.which_event = com_qcardio_bridge_BridgeEvent_write_result_tag;
    copyString(normalizeUuid(cmd.uuid), evt.event.write_result.uuid, sizeof(evt.event.write_result.uuid));
    emit(evt);
}

void BridgeController::runConfigure(const com_qcardio_bridge_ConfigureCommand& cmd) {
    if (cmd.device_type[0] != '\0' && findPlugin(cmd.device_type) == nullptr) {
        sendError(ErrorCode::NotSupported, cmd.device_type);
        return;
    }

    DeviceDescriptor next = device_;
    if (cmd.reset) {
        clearPersistentSettings();
        next = DeviceDescriptor{};
        next.type = DEFAULT_DEVICE_TYPE;
    }
    if (cmd.device_type[0] != '\0') {
        next.type = cmd.device_type;
        storeDeviceType(next.type);
    }
    if (cmd.address[0] != '\0') {
        next.address = cmd.address;
        storeAddress(next.address);
    }
    if (cmd.adapter[0] != '\0') {
        next.adapter = cmd.adapter;
        storeAdapter(next.adapter);
    }
    if (cmd.set_scan_timeout_ms) {
        next.scanTimeoutMs = clampScanTimeout(cmd.scan_timeout_ms);
        storeScanTimeoutMs(next.scanTimeoutMs);
    }
    if (cmd.set_measure_timeout_ms) {
        next.measureTimeoutMs = cmd.measure_timeout_ms;
        storeMeasureTimeoutMs(next.measureTimeoutMs);
    }
    if (cmd.set_poll_interval_ms) {
        next.pollIntervalMs = cmd.poll_interval_ms;
        storePollIntervalMs(next.pollIntervalMs);
    }
    if (cmd.set_connect_retries) {
        next.connectRetries = static_cast<uint8_t>(std::min<uint32_t>(cmd.connect_retries, 255));
        storeConnectRetries(next.connectRetries);
    }
    if (cmd.set_retry_backoff_ms) {
        next.retryBackoffMs = clampRetryBackoff(cmd.retry_backoff_ms);
        storeRetryBackoffMs(next.retryBackoffMs);
    }

    if (!configure(next)) {
        sendError(ErrorCode::NotSupported, next.type.c_str());
    }
    sendSettings();
}

void BridgeController::runSetTime(const com_qcardio_bridge_SetTimeCommand& cmd) {
    if (cmd.epoch_seconds < MIN_VALID_EPOCH_S) {
        sendError(ErrorCode::NotSupported, "set_time");
        return;
    }
    if (!clock_.setEpochSeconds(cmd.epoch_seconds)) {
        sendError(ErrorCode::NotSupported, "set_time");
        return;
    }
    QC_LOG("BRIDGE", "wall clock set to %lld", static_cast<long long>(cmd.epoch_seconds));
    sendSettings();
}

void BridgeController::sendError(ErrorCode code, const char* context) {
    QC_WARN("BRIDGE", "%s failed: %s", context, errorLabel(code));
    com_qcardio_bridge_BridgeEvent evt = com_qcardio_bridge_BridgeEvent_init_default;
    evt.which_event = com_qcardio_bridge_BridgeEvent_error_tag;
    toProto(code, context, evt.event.error);
    emit(evt);
}

void BridgeController::sendSettings() {
    com_qcardio_bridge_BridgeEvent evt = com_qcardio_bridge_BridgeEvent_init_default;
    evt.which_event = com_qcardio_bridge_BridgeEvent_settings_tag;
    toProto(device_, evt.event.settings);
    evt.event.settings.time_synced = clock_.wallClockSynced();
    evt.event.settings.epoch_seconds = evt.event.settings.time_synced ? clock_.epochSeconds() : 0;
    emit(evt);
}

void BridgeController::emit(com_qcardio_bridge_BridgeEvent& event) {
    event.timestamp_ms = clock_.nowMs();
    if (send_) {
        send_(event);
    }
}

}  // namespace qcardio
