#pragma once

#include <memory>

#include "BleTransport.h"
#include "Clock.h"
#include "DevicePlugin.h"
#include "DeviceTypes.h"

namespace qcardio {

// Vendor Control Point of the QardioArm cuff (write + notify).
constexpr const char* kQardioArmControlPointUuid = "583cb5b3-875d-40ed-9098-c39eb0c1983d";

DeviceProfile qardioArmProfile();
std::unique_ptr<DevicePlugin> createQardioArm(const DeviceDescriptor& device, BleTransport& transport, Clock& clock);

}  // namespace qcardio
