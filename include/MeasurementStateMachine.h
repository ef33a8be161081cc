#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "BleTransport.h"
#include "Clock.h"
#include "Errors.h"
#include "GattRegistry.h"
#include "NotificationDispatcher.h"
#include "ValueCodec.h"

namespace qcardio {

enum class Phase : uint8_t { Idle, Inflating, Measuring, Deflating, Completed, Aborted };

enum class Trigger : uint8_t {
    Start,
    VendorInflating,
    VendorMeasuring,
    VendorDeflating,
    VendorAborted,
    FinalMeasurement,
    Timeout,
    Cancel,
    Fault,
};

enum class AbortReason : uint8_t { None, VendorSignaled, Timeout, DecodeError, UserCancelled, LinkLost, Overrun };

const char* phaseLabel(Phase phase);
const char* triggerLabel(Trigger trigger);
const char* abortReasonLabel(AbortReason reason);

bool isTerminal(Phase phase);

/**
 * @brief Transition function of the measurement cycle.
 *
 * Vendor phases only move forward (a missed phase may be skipped). A final
 * measurement completes only from Deflating. Timeout, Cancel, Fault and a
 * vendor abort reach Aborted from every non-terminal phase. Completed and
 * Aborted absorb every trigger. Triggers with no effect return @p from.
 */
Phase nextPhase(Phase from, Trigger trigger);

struct ProgressEvent {
    Phase phase = Phase::Idle;
    std::optional<MeasurementValues> interim;
    uint64_t atMs = 0;
};

struct MeasurementChannels {
    std::string measurementUuid;
    std::string controlUuid;
};

/**
 * @brief Drives one activate/inflate/measure/deflate cycle.
 *
 * Owns the single in-flight Phase. Frame handlers run from
 * NotificationDispatcher::pump() on the foreground loop; progress is queued
 * and drained by the caller. Entering Completed or Aborted unsubscribes both
 * channels.
 */
class MeasurementStateMachine {
public:
    MeasurementStateMachine(GattRegistry& registry, NotificationDispatcher& dispatcher, BleTransport& transport,
                            Clock& clock);
    ~MeasurementStateMachine();

    MeasurementStateMachine(const MeasurementStateMachine&) = delete;
    MeasurementStateMachine& operator=(const MeasurementStateMachine&) = delete;

    // Subscribes both channels and writes the activation command. On failure
    // nothing stays subscribed and the machine remains Idle.
    ErrorCode start(const MeasurementChannels& channels, uint32_t timeoutMs);

    void evaluateTimeouts();
    void abort(AbortReason reason, const std::string& detail = std::string());

    Phase phase() const { return phase_; }
    bool terminal() const { return isTerminal(phase_); }
    AbortReason abortReason() const { return reason_; }
    const std::string& abortDetail() const { return detail_; }

    // The Blood Pressure Measurement frame that carried the measurement status.
    const Bytes& finalFrame() const { return finalFrame_; }
    bool finalHeld() const { return finalHeld_; }

    std::vector<ProgressEvent> drainProgress();

private:
    void handleMeasurementFrame(const NotificationFrame& frame);
    void handleControlFrame(const NotificationFrame& frame);
    void handleOverrun(const std::string& uuid, uint32_t dropped);
    void apply(Trigger trigger, AbortReason reason = AbortReason::None, const std::string& detail = std::string());
    void releaseChannels();
    void pushProgress(std::optional<MeasurementValues> interim = std::nullopt);

    GattRegistry& registry_;
    NotificationDispatcher& dispatcher_;
    BleTransport& transport_;
    Clock& clock_;

    Phase phase_ = Phase::Idle;
    AbortReason reason_ = AbortReason::None;
    std::string detail_;

    SubscriptionHandle measurementSub_ = kNoSubscription;
    SubscriptionHandle controlSub_ = kNoSubscription;
    uint32_t timeoutMs_ = 0;
    uint64_t lastFrameMs_ = 0;

    Bytes finalFrame_;
    bool finalHeld_ = false;
    std::vector<ProgressEvent> progress_;
};

}  // namespace qcardio
