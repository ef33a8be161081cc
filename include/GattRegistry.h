#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "BleTransport.h"
#include "Errors.h"

namespace qcardio {

struct AnnotationEntry {
    const char* uuid;
    const char* name;
};

struct Characteristic {
    std::string uuid;
    uint16_t handle = 0;
    uint8_t properties = 0;
    std::string annotation;

    bool canRead() const { return (properties & char_props::kRead) != 0; }
    bool canWrite() const { return (properties & (char_props::kWrite | char_props::kWriteNoResponse)) != 0; }
    bool canNotify() const { return (properties & (char_props::kNotify | char_props::kIndicate)) != 0; }
};

struct Service {
    std::string uuid;
    std::string annotation;
    std::vector<Characteristic> characteristics;
};

using GattCatalog = std::vector<Service>;

// Lowercase 128-bit form. 16/32-bit short forms ("2a35", "0x2A35") expand
// onto the Bluetooth SIG base UUID.
std::string normalizeUuid(const std::string& uuid);
std::string sigUuid(uint16_t shortUuid);

// "read,write,notify" style label, in fixed property order.
std::string propertiesLabel(uint8_t properties);

class GattRegistry {
public:
    explicit GattRegistry(std::vector<AnnotationEntry> vendorAnnotations = {});

    ErrorCode discover(BleTransport& transport, uint32_t sessionId);
    void invalidate();

    bool valid() const { return valid_; }
    uint32_t sessionId() const { return sessionId_; }
    const GattCatalog& catalog() const { return catalog_; }

    // nullptr when unknown or when the catalog has been invalidated.
    const Characteristic* find(const std::string& uuid) const;

    std::optional<std::string> annotate(const std::string& uuid) const;

private:
    std::vector<AnnotationEntry> vendorAnnotations_;
    GattCatalog catalog_;
    bool valid_ = false;
    uint32_t sessionId_ = 0;
};

}  // namespace qcardio
