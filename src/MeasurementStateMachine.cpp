#include "MeasurementStateMachine.h"

#include <cstdio>
#include <utility>

#include "system/Log.h"

namespace qcardio {

const char* phaseLabel(Phase phase) {
    switch (phase) {
        case Phase::Idle:
            return "idle";
        case Phase::Inflating:
            return "inflating";
        case Phase::Measuring:
            return "measuring";
        case Phase::Deflating:
            return "deflating";
        case Phase::Completed:
            return "completed";
        case Phase::Aborted:
            return "aborted";
    }
    return "idle";
}

const char* triggerLabel(Trigger trigger) {
    switch (trigger) {
        case Trigger::Start:
            return "start";
        case Trigger::VendorInflating:
            return "vendor-inflating";
        case Trigger::VendorMeasuring:
            return "vendor-measuring";
        case Trigger::VendorDeflating:
            return "vendor-deflating";
        case Trigger::VendorAborted:
            return "vendor-aborted";
        case Trigger::FinalMeasurement:
            return "final-measurement";
        case Trigger::Timeout:
            return "timeout";
        case Trigger::Cancel:
            return "cancel";
        case Trigger::Fault:
            return "fault";
    }
    return "fault";
}

const char* abortReasonLabel(AbortReason reason) {
    switch (reason) {
        case AbortReason::None:
            return "none";
        case AbortReason::VendorSignaled:
            return "vendor-signaled";
        case AbortReason::Timeout:
            return "timeout";
        case AbortReason::DecodeError:
            return "decode-error";
        case AbortReason::UserCancelled:
            return "user-cancelled";
        case AbortReason::LinkLost:
            return "link-lost";
        case AbortReason::Overrun:
            return "overrun";
    }
    return "none";
}

bool isTerminal(Phase phase) {
    return phase == Phase::Completed || phase == Phase::Aborted;
}

Phase nextPhase(Phase from, Trigger trigger) {
    if (isTerminal(from)) {
        return from;
    }
    switch (trigger) {
        case Trigger::Start:
            return from == Phase::Idle ? Phase::Inflating : from;
        case Trigger::VendorInflating:
            return from;
        case Trigger::VendorMeasuring:
            return from == Phase::Inflating ? Phase::Measuring : from;
        case Trigger::VendorDeflating:
            return (from == Phase::Inflating || from == Phase::Measuring) ? Phase::Deflating : from;
        case Trigger::FinalMeasurement:
            return from == Phase::Deflating ? Phase::Completed : from;
        case Trigger::VendorAborted:
        case Trigger::Timeout:
        case Trigger::Cancel:
        case Trigger::Fault:
            return Phase::Aborted;
    }
    return from;
}

MeasurementStateMachine::MeasurementStateMachine(GattRegistry& registry, NotificationDispatcher& dispatcher,
                                                 BleTransport& transport, Clock& clock)
    : registry_(registry), dispatcher_(dispatcher), transport_(transport), clock_(clock) {}

MeasurementStateMachine::~MeasurementStateMachine() {
    releaseChannels();
}

ErrorCode MeasurementStateMachine::start(const MeasurementChannels& channels, uint32_t timeoutMs) {
    if (phase_ != Phase::Idle) {
        QC_WARN("MEASURE", "start ignored in phase %s", phaseLabel(phase_));
        return ErrorCode::NotSupported;
    }
    const Characteristic* measurement = registry_.find(channels.measurementUuid);
    const Characteristic* control = registry_.find(channels.controlUuid);
    if (measurement == nullptr || control == nullptr) {
        QC_WARN("MEASURE", "measurement channels missing from catalog");
        return ErrorCode::UnknownCharacteristic;
    }

    ErrorCode rc = dispatcher_.subscribe(
        *measurement, [this](const NotificationFrame& frame) { handleMeasurementFrame(frame); },
        [this](const std::string& uuid, uint32_t dropped) { handleOverrun(uuid, dropped); }, measurementSub_);
    if (!isOk(rc)) {
        return rc;
    }
    rc = dispatcher_.subscribe(
        *control, [this](const NotificationFrame& frame) { handleControlFrame(frame); },
        [this](const std::string& uuid, uint32_t dropped) { handleOverrun(uuid, dropped); }, controlSub_);
    if (!isOk(rc)) {
        releaseChannels();
        return rc;
    }

    const Bytes activation(kActivationCommand.begin(), kActivationCommand.end());
    rc = transport_.write(control->uuid, activation, true);
    if (!isOk(rc)) {
        QC_WARN("MEASURE", "activation write failed: %s", errorLabel(rc));
        releaseChannels();
        return rc;
    }

    timeoutMs_ = timeoutMs;
    lastFrameMs_ = clock_.nowMs();
    apply(Trigger::Start);
    return ErrorCode::Ok;
}

void MeasurementStateMachine::evaluateTimeouts() {
    if (phase_ == Phase::Idle || terminal() || timeoutMs_ == 0) {
        return;
    }
    const uint64_t now = clock_.nowMs();
    if (now - lastFrameMs_ > timeoutMs_) {
        char detail[64];
        std::snprintf(detail, sizeof(detail), "no frame for %u ms in %s", static_cast<unsigned>(now - lastFrameMs_),
                      phaseLabel(phase_));
        apply(Trigger::Timeout, AbortReason::Timeout, detail);
    }
}

void MeasurementStateMachine::abort(AbortReason reason, const std::string& detail) {
    if (terminal()) {
        return;
    }
    const Trigger trigger = reason == AbortReason::UserCancelled ? Trigger::Cancel
                            : reason == AbortReason::Timeout     ? Trigger::Timeout
                            : reason == AbortReason::VendorSignaled ? Trigger::VendorAborted
                                                                  : Trigger::Fault;
    apply(trigger, reason, detail);
}

std::vector<ProgressEvent> MeasurementStateMachine::drainProgress() {
    std::vector<ProgressEvent> out;
    out.swap(progress_);
    return out;
}

void MeasurementStateMachine::handleMeasurementFrame(const NotificationFrame& frame) {
    if (terminal()) {
        return;
    }
    lastFrameMs_ = clock_.nowMs();

    uint16_t status = 0;
    if (isCuffErrorFrame(frame.data.data(), frame.data.size(), status)) {
        char detail[48];
        std::snprintf(detail, sizeof(detail), "cuff error 0x%04x (arm movement)", static_cast<unsigned>(status));
        apply(Trigger::VendorAborted, AbortReason::VendorSignaled, detail);
        return;
    }

    MeasurementValues values;
    const ErrorCode rc = decodeBloodPressureMeasurement(frame.data.data(), frame.data.size(), values);
    if (!isOk(rc)) {
        apply(Trigger::Fault, AbortReason::DecodeError,
              std::string(errorLabel(rc)) + " " + toHex(frame.data.data(), frame.data.size()));
        return;
    }

    if (!values.hasMeasurementStatus()) {
        pushProgress(values);
        return;
    }

    finalFrame_ = frame.data;
    if (phase_ == Phase::Deflating) {
        apply(Trigger::FinalMeasurement);
    } else {
        finalHeld_ = true;
        QC_LOG("MEASURE", "final measurement held until deflating (phase %s)", phaseLabel(phase_));
    }
}

void MeasurementStateMachine::handleControlFrame(const NotificationFrame& frame) {
    if (terminal()) {
        return;
    }
    lastFrameMs_ = clock_.nowMs();

    VendorEvent event;
    const ErrorCode rc = decodeVendorFrame(frame.data.data(), frame.data.size(), event);
    if (!isOk(rc)) {
        apply(Trigger::Fault, AbortReason::DecodeError,
              std::string(errorLabel(rc)) + " " + toHex(frame.data.data(), frame.data.size()));
        return;
    }
    if (event.kind == VendorEvent::Kind::Unknown) {
        QC_LOG("MEASURE", "ignoring vendor frame %s", toHex(event.raw.data(), event.raw.size()).c_str());
        return;
    }

    switch (event.phase) {
        case VendorPhase::Inflating:
            apply(Trigger::VendorInflating);
            break;
        case VendorPhase::Measuring:
            apply(Trigger::VendorMeasuring);
            break;
        case VendorPhase::Deflating:
            apply(Trigger::VendorDeflating);
            if (finalHeld_ && phase_ == Phase::Deflating) {
                finalHeld_ = false;
                apply(Trigger::FinalMeasurement);
            }
            break;
        case VendorPhase::Aborted:
            apply(Trigger::VendorAborted, AbortReason::VendorSignaled, "device aborted");
            break;
        case VendorPhase::Error:
            apply(Trigger::VendorAborted, AbortReason::VendorSignaled, "device error");
            break;
        case VendorPhase::Completed:
            QC_LOG("MEASURE", "device reports completed in %s", phaseLabel(phase_));
            break;
    }
}

void MeasurementStateMachine::handleOverrun(const std::string& uuid, uint32_t dropped) {
    char detail[96];
    std::snprintf(detail, sizeof(detail), "%u frames dropped on %s", static_cast<unsigned>(dropped), uuid.c_str());
    abort(AbortReason::Overrun, detail);
}

void MeasurementStateMachine::apply(Trigger trigger, AbortReason reason, const std::string& detail) {
    const Phase next = nextPhase(phase_, trigger);
    if (next == phase_) {
        return;
    }
    QC_LOG("MEASURE", "%s -> %s (%s)", phaseLabel(phase_), phaseLabel(next), triggerLabel(trigger));
    phase_ = next;
    if (phase_ == Phase::Aborted) {
        reason_ = reason == AbortReason::None ? AbortReason::DecodeError : reason;
        detail_ = detail;
        QC_WARN("MEASURE", "aborted: %s %s", abortReasonLabel(reason_), detail_.c_str());
    }
    pushProgress();
    if (terminal()) {
        releaseChannels();
    }
}

void MeasurementStateMachine::releaseChannels() {
    // Both are attempted even if the first one fails.
    const ErrorCode measurementRc = dispatcher_.unsubscribe(measurementSub_);
    const ErrorCode controlRc = dispatcher_.unsubscribe(controlSub_);
    measurementSub_ = kNoSubscription;
    controlSub_ = kNoSubscription;
    if (!isOk(measurementRc) || !isOk(controlRc)) {
        QC_WARN("MEASURE", "unsubscribe failed: measurement=%s control=%s", errorLabel(measurementRc),
                errorLabel(controlRc));
    }
}

void MeasurementStateMachine::pushProgress(std::optional<MeasurementValues> interim) {
    ProgressEvent event;
    event.phase = phase_;
    event.interim = std::move(interim);
    event.atMs = clock_.nowMs();
    progress_.push_back(std::move(event));
}

}  // namespace qcardio
