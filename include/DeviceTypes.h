#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Config.h"

namespace qcardio {

using Bytes = std::vector<uint8_t>;

struct FieldEntry {
    std::string key;
    std::string value;
};

using FieldList = std::vector<FieldEntry>;

struct DeviceDescriptor {
    std::string type;
    std::string address;
    std::string adapter;
    std::string name;
    uint32_t scanTimeoutMs = DEFAULT_SCAN_TIMEOUT_MS;
    uint32_t measureTimeoutMs = DEFAULT_MEASURE_TIMEOUT_MS;
    uint32_t pollIntervalMs = DEFAULT_POLL_INTERVAL_MS;
    uint8_t connectRetries = DEFAULT_CONNECT_RETRIES;
    uint32_t retryBackoffMs = DEFAULT_RETRY_BACKOFF_MS;
};

// Identity is address (case-insensitive) plus adapter.
bool sameDevice(const DeviceDescriptor& a, const DeviceDescriptor& b);

const std::string* findField(const FieldList& fields, const std::string& key);

}  // namespace qcardio
