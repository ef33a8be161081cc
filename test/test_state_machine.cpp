#include <unity.h>

#include <memory>
#include <string>
#include <vector>

#include "FakeClock.h"
#include "FakeTransport.h"
#include "GattRegistry.h"
#include "MeasurementStateMachine.h"
#include "NotificationDispatcher.h"

using qcardio::AbortReason;
using qcardio::Bytes;
using qcardio::ErrorCode;
using qcardio::GattRegistry;
using qcardio::MeasurementChannels;
using qcardio::MeasurementStateMachine;
using qcardio::NotificationDispatcher;
using qcardio::Phase;
using qcardio::ProgressEvent;
using qcardio::Trigger;
using qcardio::test::FakeClock;
using qcardio::test::FakeTransport;

namespace {

// One connected session with the Arm's catalog and a dispatcher wired to the transport.
struct Rig {
    FakeTransport transport;
    FakeClock clock;
    GattRegistry registry;
    NotificationDispatcher dispatcher{transport};
    MeasurementChannels channels;

    Rig() {
        transport.services = qcardio::test::qardioArmServices();
        transport.linkUp = true;
        registry.discover(transport, 1);
        transport.setNotifyCallback([this](const std::string& uuid, const uint8_t* data, size_t length) {
            dispatcher.onTransportFrame(uuid, data, length);
        });
        channels.measurementUuid = qcardio::sigUuid(0x2A35);
        channels.controlUuid = qcardio::test::kControlPointUuid;
    }

    void control(const Bytes& frame) {
        transport.notify(qcardio::test::kControlPointUuid, frame);
        dispatcher.pump();
    }

    void measurement(const Bytes& frame) {
        transport.notify("2a35", frame);
        dispatcher.pump();
    }
};

std::vector<Phase> phasesOf(const std::vector<ProgressEvent>& events) {
    std::vector<Phase> phases;
    for (const auto& event : events) {
        phases.push_back(event.phase);
    }
    return phases;
}

}  // namespace

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

static void test_transition_table() {
    TEST_ASSERT_EQUAL(Phase::Inflating, qcardio::nextPhase(Phase::Idle, Trigger::Start));
    TEST_ASSERT_EQUAL(Phase::Inflating, qcardio::nextPhase(Phase::Inflating, Trigger::VendorInflating));
    TEST_ASSERT_EQUAL(Phase::Measuring, qcardio::nextPhase(Phase::Inflating, Trigger::VendorMeasuring));
    TEST_ASSERT_EQUAL(Phase::Deflating, qcardio::nextPhase(Phase::Measuring, Trigger::VendorDeflating));
    TEST_ASSERT_EQUAL(Phase::Deflating, qcardio::nextPhase(Phase::Inflating, Trigger::VendorDeflating));
    TEST_ASSERT_EQUAL(Phase::Completed, qcardio::nextPhase(Phase::Deflating, Trigger::FinalMeasurement));

    // No backwards moves and no early completion.
    TEST_ASSERT_EQUAL(Phase::Deflating, qcardio::nextPhase(Phase::Deflating, Trigger::VendorMeasuring));
    TEST_ASSERT_EQUAL(Phase::Measuring, qcardio::nextPhase(Phase::Measuring, Trigger::VendorInflating));
    TEST_ASSERT_EQUAL(Phase::Measuring, qcardio::nextPhase(Phase::Measuring, Trigger::FinalMeasurement));
    TEST_ASSERT_EQUAL(Phase::Idle, qcardio::nextPhase(Phase::Idle, Trigger::VendorMeasuring));
    TEST_ASSERT_EQUAL(Phase::Inflating, qcardio::nextPhase(Phase::Inflating, Trigger::Start));

    const Trigger aborts[] = {Trigger::VendorAborted, Trigger::Timeout, Trigger::Cancel, Trigger::Fault};
    const Phase live[] = {Phase::Idle, Phase::Inflating, Phase::Measuring, Phase::Deflating};
    for (Trigger trigger : aborts) {
        for (Phase phase : live) {
            TEST_ASSERT_EQUAL(Phase::Aborted, qcardio::nextPhase(phase, trigger));
        }
    }

    const Trigger all[] = {Trigger::Start,         Trigger::VendorInflating, Trigger::VendorMeasuring,
                           Trigger::VendorDeflating, Trigger::VendorAborted, Trigger::FinalMeasurement,
                           Trigger::Timeout,       Trigger::Cancel,          Trigger::Fault};
    for (Trigger trigger : all) {
        TEST_ASSERT_EQUAL(Phase::Completed, qcardio::nextPhase(Phase::Completed, trigger));
        TEST_ASSERT_EQUAL(Phase::Aborted, qcardio::nextPhase(Phase::Aborted, trigger));
    }
}

static void test_start_subscribes_and_activates() {
    Rig rig;
    MeasurementStateMachine machine(rig.registry, rig.dispatcher, rig.transport, rig.clock);

    TEST_ASSERT_EQUAL(ErrorCode::Ok, machine.start(rig.channels, 60000));
    TEST_ASSERT_EQUAL(Phase::Inflating, machine.phase());
    TEST_ASSERT_TRUE(rig.dispatcher.subscribed("2a35"));
    TEST_ASSERT_TRUE(rig.dispatcher.subscribed(qcardio::test::kControlPointUuid));

    TEST_ASSERT_EQUAL_UINT(1, rig.transport.writes.size());
    const auto& write = rig.transport.writes[0];
    TEST_ASSERT_EQUAL_STRING(qcardio::test::kControlPointUuid, write.uuid.c_str());
    TEST_ASSERT_EQUAL_UINT(2, write.value.size());
    TEST_ASSERT_EQUAL_HEX8(0xF1, write.value[0]);
    TEST_ASSERT_EQUAL_HEX8(0x01, write.value[1]);
    TEST_ASSERT_TRUE(write.withResponse);

    TEST_ASSERT_EQUAL(ErrorCode::NotSupported, machine.start(rig.channels, 60000));
}

static void test_rejected_activation_leaves_nothing_subscribed() {
    Rig rig;
    rig.transport.writeErrors[qcardio::test::kControlPointUuid] = ErrorCode::WriteRejected;
    MeasurementStateMachine machine(rig.registry, rig.dispatcher, rig.transport, rig.clock);

    TEST_ASSERT_EQUAL(ErrorCode::WriteRejected, machine.start(rig.channels, 60000));
    TEST_ASSERT_EQUAL(Phase::Idle, machine.phase());
    TEST_ASSERT_EQUAL_UINT(0, rig.dispatcher.subscriptionCount());
    TEST_ASSERT_EQUAL_UINT(1, rig.transport.disabledCount("2a35"));
    TEST_ASSERT_EQUAL_UINT(1, rig.transport.disabledCount(qcardio::test::kControlPointUuid));
}

static void test_missing_channel_rejected() {
    Rig rig;
    MeasurementStateMachine machine(rig.registry, rig.dispatcher, rig.transport, rig.clock);
    MeasurementChannels channels = rig.channels;
    channels.controlUuid = "ffe1";

    TEST_ASSERT_EQUAL(ErrorCode::UnknownCharacteristic, machine.start(channels, 60000));
    TEST_ASSERT_EQUAL(Phase::Idle, machine.phase());
    TEST_ASSERT_EQUAL_UINT(0, rig.transport.notificationChanges.size());
}

static void test_full_cycle_completes() {
    Rig rig;
    MeasurementStateMachine machine(rig.registry, rig.dispatcher, rig.transport, rig.clock);
    TEST_ASSERT_EQUAL(ErrorCode::Ok, machine.start(rig.channels, 60000));

    rig.control({0xF2, 0x00});
    rig.control({0xF2, 0x01});
    TEST_ASSERT_EQUAL(Phase::Measuring, machine.phase());

    // Interim reading without status: progress only.
    rig.measurement({0x00, 0x64, 0x00, 0x00, 0x00, 0x00, 0x00});
    TEST_ASSERT_EQUAL(Phase::Measuring, machine.phase());

    rig.control({0xF2, 0x02});
    rig.measurement(qcardio::test::finalMeasurement120over80());
    TEST_ASSERT_EQUAL(Phase::Completed, machine.phase());
    TEST_ASSERT_EQUAL_UINT(9, machine.finalFrame().size());

    const auto progress = machine.drainProgress();
    const std::vector<Phase> expected = {Phase::Inflating, Phase::Measuring, Phase::Measuring, Phase::Deflating,
                                         Phase::Completed};
    const std::vector<Phase> actual = phasesOf(progress);
    TEST_ASSERT_EQUAL_UINT(expected.size(), actual.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        TEST_ASSERT_EQUAL(expected[i], actual[i]);
    }
    TEST_ASSERT_TRUE(progress[2].interim.has_value());
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 100.0f, progress[2].interim->systolic.value);

    // Both channels released on completion.
    TEST_ASSERT_EQUAL_UINT(0, rig.dispatcher.subscriptionCount());
    TEST_ASSERT_EQUAL_UINT(1, rig.transport.disabledCount("2a35"));
    TEST_ASSERT_EQUAL_UINT(1, rig.transport.disabledCount(qcardio::test::kControlPointUuid));
}

static void test_early_final_measurement_is_held() {
    Rig rig;
    MeasurementStateMachine machine(rig.registry, rig.dispatcher, rig.transport, rig.clock);
    TEST_ASSERT_EQUAL(ErrorCode::Ok, machine.start(rig.channels, 60000));

    rig.measurement(qcardio::test::finalMeasurement120over80());
    TEST_ASSERT_EQUAL(Phase::Inflating, machine.phase());
    TEST_ASSERT_TRUE(machine.finalHeld());

    rig.control({0xF2, 0x02});
    TEST_ASSERT_EQUAL(Phase::Completed, machine.phase());
    TEST_ASSERT_FALSE(machine.finalHeld());
}

static void test_vendor_abort() {
    Rig rig;
    MeasurementStateMachine machine(rig.registry, rig.dispatcher, rig.transport, rig.clock);
    TEST_ASSERT_EQUAL(ErrorCode::Ok, machine.start(rig.channels, 60000));

    rig.control({0xF2, 0x00});
    rig.control({0xF2, 0x03});
    TEST_ASSERT_EQUAL(Phase::Aborted, machine.phase());
    TEST_ASSERT_EQUAL(AbortReason::VendorSignaled, machine.abortReason());
    TEST_ASSERT_EQUAL_STRING("vendor-signaled", qcardio::abortReasonLabel(machine.abortReason()));

    // Terminal: later frames change nothing.
    rig.control({0xF2, 0x02});
    TEST_ASSERT_EQUAL(Phase::Aborted, machine.phase());
}

static void test_cuff_error_frame_aborts() {
    Rig rig;
    MeasurementStateMachine machine(rig.registry, rig.dispatcher, rig.transport, rig.clock);
    TEST_ASSERT_EQUAL(ErrorCode::Ok, machine.start(rig.channels, 60000));

    rig.measurement({0x04, 0xFF, 0x00, 0x01, 0x00});
    TEST_ASSERT_EQUAL(Phase::Aborted, machine.phase());
    TEST_ASSERT_EQUAL(AbortReason::VendorSignaled, machine.abortReason());
}

static void test_decode_errors_abort() {
    Rig rig;
    MeasurementStateMachine machine(rig.registry, rig.dispatcher, rig.transport, rig.clock);
    TEST_ASSERT_EQUAL(ErrorCode::Ok, machine.start(rig.channels, 60000));

    // Unknown discriminators are ignored.
    rig.control({0xAB, 0x01});
    TEST_ASSERT_EQUAL(Phase::Inflating, machine.phase());

    rig.measurement({0x10, 0x78});
    TEST_ASSERT_EQUAL(Phase::Aborted, machine.phase());
    TEST_ASSERT_EQUAL(AbortReason::DecodeError, machine.abortReason());
}

static void test_timeout_counts_from_last_frame() {
    Rig rig;
    MeasurementStateMachine machine(rig.registry, rig.dispatcher, rig.transport, rig.clock);
    TEST_ASSERT_EQUAL(ErrorCode::Ok, machine.start(rig.channels, 1000));

    rig.clock.now += 900;
    rig.control({0xF2, 0x01});
    rig.clock.now += 900;
    machine.evaluateTimeouts();
    TEST_ASSERT_EQUAL(Phase::Measuring, machine.phase());

    rig.clock.now += 101;
    machine.evaluateTimeouts();
    TEST_ASSERT_EQUAL(Phase::Aborted, machine.phase());
    TEST_ASSERT_EQUAL(AbortReason::Timeout, machine.abortReason());
}

static void test_timeout_past_32bit_millisecond_boundary() {
    Rig rig;
    rig.clock.now = 0xFFFFFF00ULL;
    MeasurementStateMachine machine(rig.registry, rig.dispatcher, rig.transport, rig.clock);
    TEST_ASSERT_EQUAL(ErrorCode::Ok, machine.start(rig.channels, 1000));

    rig.clock.now = 0x100000010ULL;
    machine.evaluateTimeouts();
    TEST_ASSERT_EQUAL(Phase::Inflating, machine.phase());

    rig.control({0xF2, 0x01});
    rig.clock.now += 999;
    machine.evaluateTimeouts();
    TEST_ASSERT_EQUAL(Phase::Measuring, machine.phase());

    rig.clock.now += 2;
    machine.evaluateTimeouts();
    TEST_ASSERT_EQUAL(Phase::Aborted, machine.phase());
    TEST_ASSERT_EQUAL(AbortReason::Timeout, machine.abortReason());
}

static void test_cancel_and_overrun() {
    Rig rig;
    {
        MeasurementStateMachine machine(rig.registry, rig.dispatcher, rig.transport, rig.clock);
        TEST_ASSERT_EQUAL(ErrorCode::Ok, machine.start(rig.channels, 60000));
        machine.abort(AbortReason::UserCancelled, "cancel requested");
        TEST_ASSERT_EQUAL(Phase::Aborted, machine.phase());
        TEST_ASSERT_EQUAL(AbortReason::UserCancelled, machine.abortReason());
        TEST_ASSERT_EQUAL_STRING("cancel requested", machine.abortDetail().c_str());
    }

    Rig flooded;
    NotificationDispatcher shallow(flooded.transport, 1);
    flooded.transport.setNotifyCallback([&shallow](const std::string& uuid, const uint8_t* data, size_t length) {
        shallow.onTransportFrame(uuid, data, length);
    });
    MeasurementStateMachine machine(flooded.registry, shallow, flooded.transport, flooded.clock);
    TEST_ASSERT_EQUAL(ErrorCode::Ok, machine.start(flooded.channels, 60000));
    flooded.transport.notify(qcardio::test::kControlPointUuid, {0xF2, 0x00});
    flooded.transport.notify(qcardio::test::kControlPointUuid, {0xF2, 0x01});
    shallow.pump();
    TEST_ASSERT_EQUAL(Phase::Aborted, machine.phase());
    TEST_ASSERT_EQUAL(AbortReason::Overrun, machine.abortReason());
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_transition_table);
    RUN_TEST(test_start_subscribes_and_activates);
    RUN_TEST(test_rejected_activation_leaves_nothing_subscribed);
    RUN_TEST(test_missing_channel_rejected);
    RUN_TEST(test_full_cycle_completes);
    RUN_TEST(test_early_final_measurement_is_held);
    RUN_TEST(test_vendor_abort);
    RUN_TEST(test_cuff_error_frame_aborts);
    RUN_TEST(test_decode_errors_abort);
    RUN_TEST(test_timeout_counts_from_last_frame);
    RUN_TEST(test_timeout_past_32bit_millisecond_boundary);
    RUN_TEST(test_cancel_and_overrun);
    return UNITY_END();
}
