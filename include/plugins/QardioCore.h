#pragma once

#include <memory>

#include "BleTransport.h"
#include "Clock.h"
#include "DevicePlugin.h"
#include "DeviceTypes.h"

namespace qcardio {

// ECG strap. The streaming channel is undocumented, so the profile covers
// the standard services only and measure() reports NotSupported.
DeviceProfile qardioCoreProfile();
std::unique_ptr<DevicePlugin> createQardioCore(const DeviceDescriptor& device, BleTransport& transport, Clock& clock);

}  // namespace qcardio
