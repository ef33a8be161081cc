#include "plugins/QardioArm.h"

#include "GattRegistry.h"

namespace qcardio {

namespace {

const std::vector<InfoField>& deviceInformationFields() {
    static const std::vector<InfoField> kFields = {
        {"manufacturer", "2a29"},      {"model", "2a24"},       {"serial", "2a25"},
        {"firmware_revision", "2a26"}, {"software_revision", "2a28"}, {"hardware_revision", "2a27"},
        {"system_id", "2a23"},         {"pnp_id", "2a50"},
    };
    return kFields;
}

}  // namespace

DeviceProfile qardioArmProfile() {
    DeviceProfile profile;
    profile.typeId = "arm";
    profile.displayName = "QardioArm";
    profile.annotations = {
        {kQardioArmControlPointUuid, "QardioArm Control Point"},
    };
    profile.batteryUuid = sigUuid(0x2A19);
    profile.featureUuid = sigUuid(0x2A49);
    profile.infoFields = deviceInformationFields();
    profile.supportsMeasurement = true;
    profile.channels.measurementUuid = sigUuid(0x2A35);
    profile.channels.controlUuid = normalizeUuid(kQardioArmControlPointUuid);
    return profile;
}

std::unique_ptr<DevicePlugin> createQardioArm(const DeviceDescriptor& device, BleTransport& transport, Clock& clock) {
    return std::make_unique<EnginePlugin>(qardioArmProfile(), device, transport, clock);
}

}  // namespace qcardio
