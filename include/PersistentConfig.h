#pragma once

#include <cstdint>
#include <string>

#include "DeviceTypes.h"

namespace qcardio {

struct PersistentSettings {
    bool hasDeviceType = false;
    std::string deviceType;
    bool hasAddress = false;
    std::string address;
    bool hasAdapter = false;
    std::string adapter;
    bool hasScanTimeoutMs = false;
    uint32_t scanTimeoutMs = 0;
    bool hasMeasureTimeoutMs = false;
    uint32_t measureTimeoutMs = 0;
    bool hasPollIntervalMs = false;
    uint32_t pollIntervalMs = 0;
    bool hasConnectRetries = false;
    uint8_t connectRetries = 0;
    bool hasRetryBackoffMs = false;
    uint32_t retryBackoffMs = 0;
};

bool loadPersistentSettings(PersistentSettings& out);
void storeDeviceType(const std::string& value);
void storeAddress(const std::string& value);
void storeAdapter(const std::string& value);
void storeScanTimeoutMs(uint32_t value);
void storeMeasureTimeoutMs(uint32_t value);
void storePollIntervalMs(uint32_t value);
void storeConnectRetries(uint8_t value);
void storeRetryBackoffMs(uint32_t value);
void clearPersistentSettings();

// Overlays whatever was stored on top of the compiled-in defaults.
void applyPersistentSettings(const PersistentSettings& settings, DeviceDescriptor& device);

}  // namespace qcardio
