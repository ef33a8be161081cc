#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "BleTransport.h"
#include "Clock.h"
#include "DevicePlugin.h"
#include "DeviceTypes.h"

namespace qcardio {

using PluginFactory = std::unique_ptr<DevicePlugin> (*)(const DeviceDescriptor& device, BleTransport& transport,
                                                        Clock& clock);

struct PluginEntry {
    const char* typeId;
    const char* displayName;
    PluginFactory create;
};

const PluginEntry* pluginTable(size_t& count);
const PluginEntry* findPlugin(const std::string& typeId);

// nullptr when device.type names no registered plugin.
std::unique_ptr<DevicePlugin> createPlugin(const DeviceDescriptor& device, BleTransport& transport, Clock& clock);

}  // namespace qcardio
