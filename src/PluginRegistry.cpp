#include "PluginRegistry.h"

#include "plugins/QardioArm.h"
#include "plugins/QardioCore.h"
#include "system/Log.h"

namespace qcardio {

namespace {

const PluginEntry kPlugins[] = {
    {"arm", "QardioArm blood pressure monitor", &createQardioArm},
    {"core", "QardioCore ECG strap", &createQardioCore},
};

}  // namespace

const PluginEntry* pluginTable(size_t& count) {
    count = sizeof(kPlugins) / sizeof(kPlugins[0]);
    return kPlugins;
}

const PluginEntry* findPlugin(const std::string& typeId) {
    for (const auto& entry : kPlugins) {
        if (typeId == entry.typeId) {
            return &entry;
        }
    }
    return nullptr;
}

std::unique_ptr<DevicePlugin> createPlugin(const DeviceDescriptor& device, BleTransport& transport, Clock& clock) {
    const PluginEntry* entry = findPlugin(device.type);
    if (entry == nullptr) {
        QC_WARN("BRIDGE", "no plugin for device type '%s'", device.type.c_str());
        return nullptr;
    }
    return entry->create(device, transport, clock);
}

}  // namespace qcardio
