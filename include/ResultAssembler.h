#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "Clock.h"
#include "DeviceTypes.h"
#include "Errors.h"
#include "MeasurementStateMachine.h"
#include "ValueCodec.h"

namespace qcardio {

enum class Outcome : uint8_t { Completed, Aborted };

const char* outcomeLabel(Outcome outcome);

struct Record {
    DeviceDescriptor device;
    Outcome outcome = Outcome::Aborted;
    AbortReason reason = AbortReason::None;
    std::string detail;
    std::optional<MeasurementValues> values;
    std::optional<uint8_t> batteryPercent;
    std::vector<std::string> conditions;
    // Unix seconds, 0 unless timeSynced.
    int64_t capturedAt = 0;
    bool timeSynced = false;
};

/**
 * @brief Turns a terminal measurement cycle into a Record.
 *
 * The record is returned by value and nothing keeps a reference to it.
 */
class ResultAssembler {
public:
    using BatteryReader = std::function<ErrorCode(uint8_t& percent)>;

    ResultAssembler(Clock& clock, BatteryReader readBattery);

    Record assemble(const DeviceDescriptor& device, const MeasurementStateMachine& machine) const;
    Record aborted(const DeviceDescriptor& device, AbortReason reason, const std::string& detail) const;

private:
    void stamp(Record& record) const;

    Clock& clock_;
    BatteryReader readBattery_;
};

}  // namespace qcardio
