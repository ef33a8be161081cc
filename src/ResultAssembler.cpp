#include "ResultAssembler.h"

#include <utility>

#include "system/Log.h"

namespace qcardio {

const char* outcomeLabel(Outcome outcome) {
    switch (outcome) {
        case Outcome::Completed:
            return "completed";
        case Outcome::Aborted:
            return "aborted";
    }
    return "aborted";
}

ResultAssembler::ResultAssembler(Clock& clock, BatteryReader readBattery)
    : clock_(clock), readBattery_(std::move(readBattery)) {}

void ResultAssembler::stamp(Record& record) const {
    record.timeSynced = clock_.wallClockSynced();
    if (!record.timeSynced) {
        QC_WARN("MEASURE", "wall clock not set, record left unstamped");
        record.capturedAt = 0;
        return;
    }
    record.capturedAt = clock_.epochSeconds();
}

Record ResultAssembler::aborted(const DeviceDescriptor& device, AbortReason reason, const std::string& detail) const {
    Record record;
    record.device = device;
    record.outcome = Outcome::Aborted;
    record.reason = reason;
    record.detail = detail;
    stamp(record);
    return record;
}

Record ResultAssembler::assemble(const DeviceDescriptor& device, const MeasurementStateMachine& machine) const {
    if (machine.phase() != Phase::Completed) {
        return aborted(device, machine.abortReason(), machine.abortDetail());
    }

    const Bytes& frame = machine.finalFrame();
    MeasurementValues values;
    const ErrorCode rc = decodeBloodPressureMeasurement(frame.data(), frame.size(), values);
    if (!isOk(rc)) {
        return aborted(device, AbortReason::DecodeError, errorLabel(rc));
    }

    Record record;
    record.device = device;
    record.outcome = Outcome::Completed;
    if (values.measurementStatus) {
        record.conditions = decodeMeasurementConditions(*values.measurementStatus);
    }
    record.values = std::move(values);

    if (readBattery_) {
        uint8_t percent = 0;
        const ErrorCode batteryRc = readBattery_(percent);
        if (isOk(batteryRc)) {
            record.batteryPercent = percent;
        } else {
            QC_WARN("MEASURE", "battery read after measurement failed: %s", errorLabel(batteryRc));
        }
    }

    stamp(record);
    return record;
}

}  // namespace qcardio
