#include "plugins/QardioCore.h"

#include "GattRegistry.h"

namespace qcardio {

DeviceProfile qardioCoreProfile() {
    DeviceProfile profile;
    profile.typeId = "core";
    profile.displayName = "QardioCore";
    profile.batteryUuid = sigUuid(0x2A19);
    profile.infoFields = {
        {"manufacturer", "2a29"},
        {"model", "2a24"},
        {"serial", "2a25"},
        {"firmware_revision", "2a26"},
        {"software_revision", "2a28"},
        {"hardware_revision", "2a27"},
    };
    profile.supportsMeasurement = false;
    return profile;
}

std::unique_ptr<DevicePlugin> createQardioCore(const DeviceDescriptor& device, BleTransport& transport, Clock& clock) {
    return std::make_unique<EnginePlugin>(qardioCoreProfile(), device, transport, clock);
}

}  // namespace qcardio
