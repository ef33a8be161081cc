#include "GattRegistry.h"

#include <cctype>
#include <cstdio>

#include "system/Log.h"

namespace qcardio {

namespace {

constexpr const char* kSigBaseSuffix = "-0000-1000-8000-00805f9b34fb";

const AnnotationEntry kSigAnnotations[] = {
    // Services
    {"1800", "Generic Access"},
    {"1801", "Generic Attribute"},
    {"1805", "Current Time Service"},
    {"180a", "Device Information"},
    {"180d", "Heart Rate"},
    {"180f", "Battery Service"},
    {"1810", "Blood Pressure"},
    // Generic Access / Attribute
    {"2a00", "Device Name"},
    {"2a01", "Appearance"},
    {"2a04", "Peripheral Preferred Connection Parameters"},
    {"2a05", "Service Changed"},
    {"2a2b", "Current Time"},
    // Device Information
    {"2a23", "System ID"},
    {"2a24", "Model Number String"},
    {"2a25", "Serial Number String"},
    {"2a26", "Firmware Revision String"},
    {"2a27", "Hardware Revision String"},
    {"2a28", "Software Revision String"},
    {"2a29", "Manufacturer Name String"},
    {"2a50", "PnP ID"},
    // Battery
    {"2a19", "Battery Level"},
    // Blood Pressure
    {"2a35", "Blood Pressure Measurement"},
    {"2a36", "Intermediate Cuff Pressure"},
    {"2a49", "Blood Pressure Feature"},
    // Heart Rate
    {"2a37", "Heart Rate Measurement"},
    {"2a38", "Body Sensor Location"},
    {"2a39", "Heart Rate Control Point"},
};

bool isHex(const std::string& text) {
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return !text.empty();
}

const char* lookup(const AnnotationEntry* table, size_t count, const std::string& normalized) {
    for (size_t i = 0; i < count; ++i) {
        if (normalizeUuid(table[i].uuid) == normalized) {
            return table[i].name;
        }
    }
    return nullptr;
}

}  // namespace

std::string normalizeUuid(const std::string& uuid) {
    std::string value;
    value.reserve(uuid.size());
    for (char c : uuid) {
        if (c == '{' || c == '}' || c == ' ') {
            continue;
        }
        value.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (value.size() > 2 && value[0] == '0' && value[1] == 'x') {
        value.erase(0, 2);
    }
    if (value.size() == 4 && isHex(value)) {
        return "0000" + value + kSigBaseSuffix;
    }
    if (value.size() == 8 && isHex(value)) {
        return value + kSigBaseSuffix;
    }
    return value;
}

std::string sigUuid(uint16_t shortUuid) {
    char buffer[5] = {0};
    std::snprintf(buffer, sizeof(buffer), "%04x", static_cast<unsigned>(shortUuid));
    return normalizeUuid(buffer);
}

std::string propertiesLabel(uint8_t properties) {
    static const struct {
        uint8_t bit;
        const char* name;
    } kNames[] = {
        {char_props::kRead, "read"},
        {char_props::kWrite, "write"},
        {char_props::kWriteNoResponse, "write-without-response"},
        {char_props::kNotify, "notify"},
        {char_props::kIndicate, "indicate"},
    };

    std::string label;
    for (const auto& entry : kNames) {
        if (properties & entry.bit) {
            if (!label.empty()) {
                label.push_back(',');
            }
            label += entry.name;
        }
    }
    return label;
}

GattRegistry::GattRegistry(std::vector<AnnotationEntry> vendorAnnotations)
    : vendorAnnotations_(std::move(vendorAnnotations)) {}

ErrorCode GattRegistry::discover(BleTransport& transport, uint32_t sessionId) {
    invalidate();
    if (!transport.connected()) {
        return ErrorCode::NotConnected;
    }

    std::vector<RemoteService> remote;
    const ErrorCode rc = transport.discoverServices(remote);
    if (!isOk(rc)) {
        QC_WARN("GATT", "service discovery failed: %s", errorLabel(rc));
        return rc;
    }

    GattCatalog catalog;
    catalog.reserve(remote.size());
    size_t characteristicCount = 0;
    for (const auto& svc : remote) {
        Service service;
        service.uuid = normalizeUuid(svc.uuid);
        service.annotation = annotate(service.uuid).value_or("");
        service.characteristics.reserve(svc.characteristics.size());
        for (const auto& chr : svc.characteristics) {
            Characteristic characteristic;
            characteristic.uuid = normalizeUuid(chr.uuid);
            characteristic.handle = chr.handle;
            characteristic.properties = chr.properties;
            characteristic.annotation = annotate(characteristic.uuid).value_or("");
            service.characteristics.push_back(std::move(characteristic));
            ++characteristicCount;
        }
        catalog.push_back(std::move(service));
    }

    catalog_ = std::move(catalog);
    sessionId_ = sessionId;
    valid_ = true;
    QC_LOG("GATT", "catalog ready session=%u services=%u characteristics=%u",
           static_cast<unsigned>(sessionId), static_cast<unsigned>(catalog_.size()),
           static_cast<unsigned>(characteristicCount));
    return ErrorCode::Ok;
}

void GattRegistry::invalidate() {
    catalog_.clear();
    valid_ = false;
    sessionId_ = 0;
}

const Characteristic* GattRegistry::find(const std::string& uuid) const {
    if (!valid_) {
        return nullptr;
    }
    const std::string normalized = normalizeUuid(uuid);
    for (const auto& service : catalog_) {
        for (const auto& characteristic : service.characteristics) {
            if (characteristic.uuid == normalized) {
                return &characteristic;
            }
        }
    }
    return nullptr;
}

std::optional<std::string> GattRegistry::annotate(const std::string& uuid) const {
    const std::string normalized = normalizeUuid(uuid);
    if (!vendorAnnotations_.empty()) {
        if (const char* name = lookup(vendorAnnotations_.data(), vendorAnnotations_.size(), normalized)) {
            return std::string(name);
        }
    }
    if (const char* name = lookup(kSigAnnotations, sizeof(kSigAnnotations) / sizeof(kSigAnnotations[0]), normalized)) {
        return std::string(name);
    }
    return std::nullopt;
}

}  // namespace qcardio
