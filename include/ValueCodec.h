#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "DeviceTypes.h"
#include "Errors.h"

namespace qcardio {

/**
 * @brief Result class of an IEEE-11073 16-bit SFLOAT.
 *
 * Reserved mantissa patterns (exponent 0) never produce a number:
 * 0x07FF NaN, 0x0800 NotAtThisTime (NRes), 0x07FE +INF, 0x0802 -INF,
 * 0x0801 (reserved for future use) is reported as NaN.
 */
enum class SfloatKind : uint8_t { Value, NaN, NotAtThisTime, PositiveInfinity, NegativeInfinity };

struct Sfloat {
    SfloatKind kind = SfloatKind::NaN;
    float value = std::numeric_limits<float>::quiet_NaN();

    bool isNumber() const { return kind == SfloatKind::Value; }
};

Sfloat decodeSfloat(uint8_t lo, uint8_t hi);
const char* sfloatKindLabel(SfloatKind kind);

namespace bpm_flags {
constexpr uint8_t kUnitKpa = 0x01;
constexpr uint8_t kTimestamp = 0x02;
constexpr uint8_t kPulseRate = 0x04;
constexpr uint8_t kUserId = 0x08;
constexpr uint8_t kMeasurementStatus = 0x10;
}  // namespace bpm_flags

enum class PressureUnit : uint8_t { MmHg, KPa };

const char* pressureUnitLabel(PressureUnit unit);

struct DeviceTimestamp {
    uint16_t year = 0;
    uint8_t month = 0;
    uint8_t day = 0;
    uint8_t hours = 0;
    uint8_t minutes = 0;
    uint8_t seconds = 0;
};

struct MeasurementValues {
    uint8_t flags = 0;
    PressureUnit unit = PressureUnit::MmHg;
    Sfloat systolic;
    Sfloat diastolic;
    Sfloat meanArterial;
    std::optional<DeviceTimestamp> timestamp;
    std::optional<Sfloat> pulseRate;
    std::optional<uint8_t> userId;
    std::optional<uint16_t> measurementStatus;

    bool hasMeasurementStatus() const { return (flags & bpm_flags::kMeasurementStatus) != 0; }
};

// Decodes a Blood Pressure Measurement (0x2A35) payload. On error `out` is left untouched.
ErrorCode decodeBloodPressureMeasurement(const uint8_t* data, size_t length, MeasurementValues& out);

// A measurement notification starting 0x04 0xFF is the cuff reporting an aborted
// inflation (arm movement). Bytes 3..4 carry the status word.
bool isCuffErrorFrame(const uint8_t* data, size_t length, uint16_t& status);

constexpr uint8_t kVendorPhaseDiscriminator = 0xF2;
constexpr std::array<uint8_t, 2> kActivationCommand = {0xF1, 0x01};

enum class VendorPhase : uint8_t {
    Inflating = 0x00,
    Measuring = 0x01,
    Deflating = 0x02,
    Aborted = 0x03,
    Completed = 0x04,
    Error = 0x05,
};

const char* vendorPhaseLabel(VendorPhase phase);

struct VendorEvent {
    enum class Kind : uint8_t { PhaseChange, Unknown };

    Kind kind = Kind::Unknown;
    VendorPhase phase = VendorPhase::Inflating;
    Bytes raw;
};

// Decodes a Control Point notification. Unknown discriminators decode to
// Kind::Unknown with the raw bytes; a 0xF2 frame with an unknown phase byte
// returns UnrecognizedFrame (raw bytes are still filled in).
ErrorCode decodeVendorFrame(const uint8_t* data, size_t length, VendorEvent& out);

std::vector<std::string> decodeMeasurementConditions(uint16_t status);

struct FeatureSupport {
    uint16_t bitmask = 0;
    std::vector<std::string> supported;
};

ErrorCode decodeBloodPressureFeature(const uint8_t* data, size_t length, FeatureSupport& out);

ErrorCode decodeBatteryLevel(const uint8_t* data, size_t length, uint8_t& percent);

// Printable text is trimmed and returned as-is, anything else as lowercase hex.
std::string decodeInfoString(const Bytes& raw);

std::string toHex(const uint8_t* data, size_t length);
bool parseHex(const std::string& text, Bytes& out);

}  // namespace qcardio
