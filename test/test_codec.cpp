#include <unity.h>

#include <cmath>
#include <string>
#include <vector>

#include "ValueCodec.h"

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

using qcardio::Bytes;
using qcardio::ErrorCode;
using qcardio::FeatureSupport;
using qcardio::MeasurementValues;
using qcardio::PressureUnit;
using qcardio::Sfloat;
using qcardio::SfloatKind;
using qcardio::VendorEvent;
using qcardio::VendorPhase;

static void test_sfloat_plain_values() {
    Sfloat v = qcardio::decodeSfloat(0x78, 0x00);
    TEST_ASSERT_TRUE(v.isNumber());
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 120.0f, v.value);

    // mantissa 1234, exponent -1
    v = qcardio::decodeSfloat(0xD2, 0xF4);
    TEST_ASSERT_TRUE(v.isNumber());
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 123.4f, v.value);

    // mantissa -1 (12-bit two's complement)
    v = qcardio::decodeSfloat(0xFF, 0x0F);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, -1.0f, v.value);

    // mantissa 5, exponent +2
    v = qcardio::decodeSfloat(0x05, 0x20);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 500.0f, v.value);
}

static void test_sfloat_reserved_values() {
    TEST_ASSERT_EQUAL(SfloatKind::NaN, qcardio::decodeSfloat(0xFF, 0x07).kind);
    TEST_ASSERT_EQUAL(SfloatKind::NotAtThisTime, qcardio::decodeSfloat(0x00, 0x08).kind);
    TEST_ASSERT_EQUAL(SfloatKind::PositiveInfinity, qcardio::decodeSfloat(0xFE, 0x07).kind);
    TEST_ASSERT_EQUAL(SfloatKind::NegativeInfinity, qcardio::decodeSfloat(0x02, 0x08).kind);
    TEST_ASSERT_EQUAL(SfloatKind::NaN, qcardio::decodeSfloat(0x01, 0x08).kind);

    const Sfloat nres = qcardio::decodeSfloat(0x00, 0x08);
    TEST_ASSERT_FALSE(nres.isNumber());
    TEST_ASSERT_TRUE(std::isnan(nres.value));
    TEST_ASSERT_TRUE(std::isinf(qcardio::decodeSfloat(0xFE, 0x07).value));
}

static void test_bpm_minimal_frame() {
    const Bytes frame = {0x00, 0x78, 0x00, 0x50, 0x00, 0x5D, 0x00};
    MeasurementValues values;
    TEST_ASSERT_EQUAL(ErrorCode::Ok, qcardio::decodeBloodPressureMeasurement(frame.data(), frame.size(), values));
    TEST_ASSERT_EQUAL(PressureUnit::MmHg, values.unit);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 120.0f, values.systolic.value);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 80.0f, values.diastolic.value);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 93.0f, values.meanArterial.value);
    TEST_ASSERT_FALSE(values.timestamp.has_value());
    TEST_ASSERT_FALSE(values.pulseRate.has_value());
    TEST_ASSERT_FALSE(values.userId.has_value());
    TEST_ASSERT_FALSE(values.hasMeasurementStatus());
}

static void test_bpm_all_optional_fields() {
    const Bytes frame = {
        0x1F,                                     // kPa, timestamp, pulse, user, status
        0x10, 0xF0, 0x0B, 0xF0, 0x0E, 0xF0,       // 1.6 / 1.1 / 1.4 kPa
        0xE8, 0x07, 0x05, 0x11, 0x08, 0x1E, 0x2D, // 2024-05-17 08:30:45
        0x48, 0x00,                               // pulse 72
        0x02,                                     // user 2
        0x05, 0x00,                               // body movement + irregular pulse
    };
    MeasurementValues values;
    TEST_ASSERT_EQUAL(ErrorCode::Ok, qcardio::decodeBloodPressureMeasurement(frame.data(), frame.size(), values));
    TEST_ASSERT_EQUAL(PressureUnit::KPa, values.unit);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 1.6f, values.systolic.value);
    TEST_ASSERT_TRUE(values.timestamp.has_value());
    TEST_ASSERT_EQUAL_UINT16(2024, values.timestamp->year);
    TEST_ASSERT_EQUAL_UINT8(5, values.timestamp->month);
    TEST_ASSERT_EQUAL_UINT8(17, values.timestamp->day);
    TEST_ASSERT_EQUAL_UINT8(45, values.timestamp->seconds);
    TEST_ASSERT_TRUE(values.pulseRate.has_value());
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 72.0f, values.pulseRate->value);
    TEST_ASSERT_EQUAL_UINT8(2, *values.userId);
    TEST_ASSERT_EQUAL_UINT16(0x0005, *values.measurementStatus);

    const std::vector<std::string> conditions = qcardio::decodeMeasurementConditions(*values.measurementStatus);
    TEST_ASSERT_EQUAL_UINT(2, conditions.size());
    TEST_ASSERT_EQUAL_STRING("body_movement", conditions[0].c_str());
    TEST_ASSERT_EQUAL_STRING("irregular_pulse", conditions[1].c_str());
}

static void test_bpm_truncated_leaves_output_untouched() {
    MeasurementValues values;
    values.flags = 0xAA;

    const Bytes shortFrame = {0x00, 0x78, 0x00, 0x50};
    TEST_ASSERT_EQUAL(ErrorCode::TruncatedPayload,
                      qcardio::decodeBloodPressureMeasurement(shortFrame.data(), shortFrame.size(), values));

    // Status flag set but the status word is missing.
    const Bytes missingStatus = {0x10, 0x78, 0x00, 0x50, 0x00, 0x5D, 0x00};
    TEST_ASSERT_EQUAL(ErrorCode::TruncatedPayload,
                      qcardio::decodeBloodPressureMeasurement(missingStatus.data(), missingStatus.size(), values));
    TEST_ASSERT_EQUAL(ErrorCode::TruncatedPayload, qcardio::decodeBloodPressureMeasurement(nullptr, 0, values));
    TEST_ASSERT_EQUAL_UINT8(0xAA, values.flags);
}

static void test_cuff_error_frame() {
    uint16_t status = 0;
    const Bytes error = {0x04, 0xFF, 0x00, 0x01, 0x00};
    TEST_ASSERT_TRUE(qcardio::isCuffErrorFrame(error.data(), error.size(), status));
    TEST_ASSERT_EQUAL_UINT16(0x0001, status);

    const Bytes measurement = {0x10, 0x78, 0x00, 0x50, 0x00, 0x5D, 0x00, 0x00, 0x00};
    TEST_ASSERT_FALSE(qcardio::isCuffErrorFrame(measurement.data(), measurement.size(), status));
}

static void test_vendor_frames() {
    VendorEvent event;
    const Bytes deflating = {0xF2, 0x02};
    TEST_ASSERT_EQUAL(ErrorCode::Ok, qcardio::decodeVendorFrame(deflating.data(), deflating.size(), event));
    TEST_ASSERT_EQUAL(VendorEvent::Kind::PhaseChange, event.kind);
    TEST_ASSERT_EQUAL(VendorPhase::Deflating, event.phase);

    const Bytes other = {0xAB, 0x01, 0x02};
    TEST_ASSERT_EQUAL(ErrorCode::Ok, qcardio::decodeVendorFrame(other.data(), other.size(), event));
    TEST_ASSERT_EQUAL(VendorEvent::Kind::Unknown, event.kind);
    TEST_ASSERT_EQUAL_UINT(3, event.raw.size());

    const Bytes badPhase = {0xF2, 0x09};
    TEST_ASSERT_EQUAL(ErrorCode::UnrecognizedFrame, qcardio::decodeVendorFrame(badPhase.data(), badPhase.size(), event));

    const Bytes cut = {0xF2};
    TEST_ASSERT_EQUAL(ErrorCode::TruncatedPayload, qcardio::decodeVendorFrame(cut.data(), cut.size(), event));
}

static void test_feature_battery_and_info() {
    FeatureSupport features;
    const Bytes bits = {0x03, 0x00};
    TEST_ASSERT_EQUAL(ErrorCode::Ok, qcardio::decodeBloodPressureFeature(bits.data(), bits.size(), features));
    TEST_ASSERT_EQUAL_UINT16(0x0003, features.bitmask);
    TEST_ASSERT_EQUAL_UINT(2, features.supported.size());
    TEST_ASSERT_EQUAL_STRING("Body Movement Detection", features.supported[0].c_str());
    TEST_ASSERT_EQUAL_STRING("Cuff Fit Detection", features.supported[1].c_str());

    uint8_t percent = 0;
    const Bytes battery = {0x45};
    TEST_ASSERT_EQUAL(ErrorCode::Ok, qcardio::decodeBatteryLevel(battery.data(), battery.size(), percent));
    TEST_ASSERT_EQUAL_UINT8(69, percent);
    TEST_ASSERT_EQUAL(ErrorCode::TruncatedPayload, qcardio::decodeBatteryLevel(nullptr, 0, percent));

    TEST_ASSERT_EQUAL_STRING("Qardio", qcardio::decodeInfoString({'Q', 'a', 'r', 'd', 'i', 'o', 0x00}).c_str());
    TEST_ASSERT_EQUAL_STRING("SN42", qcardio::decodeInfoString({' ', 'S', 'N', '4', '2', ' '}).c_str());
    TEST_ASSERT_EQUAL_STRING("01a2ff", qcardio::decodeInfoString({0x01, 0xA2, 0xFF}).c_str());
}

static void test_hex_helpers() {
    Bytes out;
    TEST_ASSERT_TRUE(qcardio::parseHex("0xF1:01", out));
    TEST_ASSERT_EQUAL_UINT(2, out.size());
    TEST_ASSERT_EQUAL_HEX8(0xF1, out[0]);
    TEST_ASSERT_EQUAL_HEX8(0x01, out[1]);
    TEST_ASSERT_FALSE(qcardio::parseHex("f1 0", out));
    TEST_ASSERT_FALSE(qcardio::parseHex("zz", out));
    TEST_ASSERT_EQUAL_STRING("f101", qcardio::toHex(out.data(), out.size()).c_str());
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_sfloat_plain_values);
    RUN_TEST(test_sfloat_reserved_values);
    RUN_TEST(test_bpm_minimal_frame);
    RUN_TEST(test_bpm_all_optional_fields);
    RUN_TEST(test_bpm_truncated_leaves_output_untouched);
    RUN_TEST(test_cuff_error_frame);
    RUN_TEST(test_vendor_frames);
    RUN_TEST(test_feature_battery_and_info);
    RUN_TEST(test_hex_helpers);
    return UNITY_END();
}
