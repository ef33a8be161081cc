#include "PersistentConfig.h"

namespace qcardio {

void applyPersistentSettings(const PersistentSettings& settings, DeviceDescriptor& device) {
    if (settings.hasDeviceType) {
        device.type = settings.deviceType;
    }
    if (settings.hasAddress) {
        device.address = settings.address;
    }
    if (settings.hasAdapter) {
        device.adapter = settings.adapter;
    }
    if (settings.hasScanTimeoutMs) {
        device.scanTimeoutMs = settings.scanTimeoutMs;
    }
    if (settings.hasMeasureTimeoutMs) {
        device.measureTimeoutMs = settings.measureTimeoutMs;
    }
    if (settings.hasPollIntervalMs) {
        device.pollIntervalMs = settings.pollIntervalMs;
    }
    if (settings.hasConnectRetries) {
        device.connectRetries = settings.connectRetries;
    }
    if (settings.hasRetryBackoffMs) {
        device.retryBackoffMs = settings.retryBackoffMs;
    }
}

}  // namespace qcardio

#ifdef ARDUINO
#include <Preferences.h>

namespace qcardio {
namespace {
constexpr const char* kNamespace = "qcardio";
constexpr const char* kKeyType = "type";
constexpr const char* kKeyAddress = "addr";
constexpr const char* kKeyAdapter = "adapter";
constexpr const char* kKeyScanTimeout = "scan_ms";
constexpr const char* kKeyMeasureTimeout = "meas_ms";
constexpr const char* kKeyPollInterval = "poll_ms";
constexpr const char* kKeyRetries = "retries";
constexpr const char* kKeyBackoff = "backoff_ms";

bool readString(Preferences& prefs, const char* key, std::string& out) {
    if (!prefs.isKey(key)) {
        return false;
    }
    out = prefs.getString(key, "").c_str();
    return true;
}

bool readUInt(Preferences& prefs, const char* key, uint32_t& out) {
    if (!prefs.isKey(key)) {
        return false;
    }
    out = prefs.getUInt(key, 0U);
    return true;
}

void writeString(const char* key, const std::string& value) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putString(key, value.c_str());
    prefs.end();
}

void writeUInt(const char* key, uint32_t value) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putUInt(key, value);
    prefs.end();
}

}  // namespace

bool loadPersistentSettings(PersistentSettings& out) {
    Preferences prefs;
    if (!prefs.begin(kNamespace, true)) {
        return false;
    }
    bool any = false;
    if (readString(prefs, kKeyType, out.deviceType)) {
        out.hasDeviceType = true;
        any = true;
    }
    if (readString(prefs, kKeyAddress, out.address)) {
        out.hasAddress = true;
        any = true;
    }
    if (readString(prefs, kKeyAdapter, out.adapter)) {
        out.hasAdapter = true;
        any = true;
    }
    if (readUInt(prefs, kKeyScanTimeout, out.scanTimeoutMs)) {
        out.hasScanTimeoutMs = true;
        any = true;
    }
    if (readUInt(prefs, kKeyMeasureTimeout, out.measureTimeoutMs)) {
        out.hasMeasureTimeoutMs = true;
        any = true;
    }
    if (readUInt(prefs, kKeyPollInterval, out.pollIntervalMs)) {
        out.hasPollIntervalMs = true;
        any = true;
    }
    if (prefs.isKey(kKeyRetries)) {
        out.connectRetries = prefs.getUChar(kKeyRetries, 0);
        out.hasConnectRetries = true;
        any = true;
    }
    if (readUInt(prefs, kKeyBackoff, out.retryBackoffMs)) {
        out.hasRetryBackoffMs = true;
        any = true;
    }
    prefs.end();
    return any;
}

void storeDeviceType(const std::string& value) {
    writeString(kKeyType, value);
}

void storeAddress(const std::string& value) {
    writeString(kKeyAddress, value);
}

void storeAdapter(const std::string& value) {
    writeString(kKeyAdapter, value);
}

void storeScanTimeoutMs(uint32_t value) {
    writeUInt(kKeyScanTimeout, value);
}

void storeMeasureTimeoutMs(uint32_t value) {
    writeUInt(kKeyMeasureTimeout, value);
}

void storePollIntervalMs(uint32_t value) {
    writeUInt(kKeyPollInterval, value);
}

void storeConnectRetries(uint8_t value) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putUChar(kKeyRetries, value);
    prefs.end();
}

void storeRetryBackoffMs(uint32_t value) {
    writeUInt(kKeyBackoff, value);
}

void clearPersistentSettings() {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.clear();
    prefs.end();
}

}  // namespace qcardio
#else

namespace qcardio {
namespace {
PersistentSettings g_settings;
}

bool loadPersistentSettings(PersistentSettings& out) {
    out = g_settings;
    return g_settings.hasDeviceType || g_settings.hasAddress || g_settings.hasAdapter || g_settings.hasScanTimeoutMs ||
           g_settings.hasMeasureTimeoutMs || g_settings.hasPollIntervalMs || g_settings.hasConnectRetries ||
           g_settings.hasRetryBackoffMs;
}

void storeDeviceType(const std::string& value) {
    g_settings.deviceType = value;
    g_settings.hasDeviceType = true;
}

void storeAddress(const std::string& value) {
    g_settings.address = value;
    g_settings.hasAddress = true;
}

void storeAdapter(const std::string& value) {
    g_settings.adapter = value;
    g_settings.hasAdapter = true;
}

void storeScanTimeoutMs(uint32_t value) {
    g_settings.scanTimeoutMs = value;
    g_settings.hasScanTimeoutMs = true;
}

void storeMeasureTimeoutMs(uint32_t value) {
    g_settings.measureTimeoutMs = value;
    g_settings.hasMeasureTimeoutMs = true;
}

void storePollIntervalMs(uint32_t value) {
    g_settings.pollIntervalMs = value;
    g_settings.hasPollIntervalMs = true;
}

void storeConnectRetries(uint8_t value) {
    g_settings.connectRetries = value;
    g_settings.hasConnectRetries = true;
}

void storeRetryBackoffMs(uint32_t value) {
    g_settings.retryBackoffMs = value;
    g_settings.hasRetryBackoffMs = true;
}

void clearPersistentSettings() {
    g_settings = PersistentSettings{};
}

}  // namespace qcardio

#endif  // ARDUINO
