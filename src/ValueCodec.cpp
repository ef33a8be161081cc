#include "ValueCodec.h"

#include <cctype>
#include <cmath>

namespace qcardio {

namespace {

constexpr uint16_t kSfloatNaN = 0x07FF;
constexpr uint16_t kSfloatNRes = 0x0800;
constexpr uint16_t kSfloatPositiveInfinity = 0x07FE;
constexpr uint16_t kSfloatNegativeInfinity = 0x0802;
constexpr uint16_t kSfloatReserved = 0x0801;

constexpr size_t kSfloatBytes = 2;
constexpr size_t kTimestampBytes = 7;
constexpr size_t kStatusBytes = 2;

const char* const kConditionNames[] = {
    "body_movement",
    "cuff_too_loose",
    "irregular_pulse",
    "pulse_rate_out_of_range",
};

const char* const kFeatureNames[] = {
    "Body Movement Detection",
    "Cuff Fit Detection",
    "Irregular Pulse Detection",
    "Pulse Rate Range Detection",
    "Measurement Position Detection",
};

uint16_t readU16(const uint8_t* data) {
    return static_cast<uint16_t>(data[0]) | (static_cast<uint16_t>(data[1]) << 8);
}

Sfloat special(SfloatKind kind) {
    Sfloat result;
    result.kind = kind;
    switch (kind) {
        case SfloatKind::PositiveInfinity:
            result.value = std::numeric_limits<float>::infinity();
            break;
        case SfloatKind::NegativeInfinity:
            result.value = -std::numeric_limits<float>::infinity();
            break;
        case SfloatKind::Value:
        case SfloatKind::NaN:
        case SfloatKind::NotAtThisTime:
            result.value = std::numeric_limits<float>::quiet_NaN();
            break;
    }
    return result;
}

int hexNibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

}  // namespace

Sfloat decodeSfloat(uint8_t lo, uint8_t hi) {
    const uint16_t raw = static_cast<uint16_t>(lo) | (static_cast<uint16_t>(hi) << 8);
    const uint16_t rawMantissa = raw & 0x0FFF;
    const uint8_t rawExponent = static_cast<uint8_t>((raw >> 12) & 0x0F);

    if (rawExponent == 0) {
        switch (rawMantissa) {
            case kSfloatNaN:
            case kSfloatReserved:
                return special(SfloatKind::NaN);
            case kSfloatNRes:
                return special(SfloatKind::NotAtThisTime);
            case kSfloatPositiveInfinity:
                return special(SfloatKind::PositiveInfinity);
            case kSfloatNegativeInfinity:
                return special(SfloatKind::NegativeInfinity);
            default:
                break;
        }
    }

    int32_t mantissa = rawMantissa;
    if (mantissa >= 0x0800) {
        mantissa -= 0x1000;
    }
    int32_t exponent = rawExponent;
    if (exponent >= 0x08) {
        exponent -= 0x10;
    }

    Sfloat result;
    result.kind = SfloatKind::Value;
    result.value = static_cast<float>(static_cast<double>(mantissa) * std::pow(10.0, exponent));
    return result;
}

const char* sfloatKindLabel(SfloatKind kind) {
    switch (kind) {
        case SfloatKind::Value:
            return "value";
        case SfloatKind::NaN:
            return "nan";
        case SfloatKind::NotAtThisTime:
            return "not-at-this-time";
        case SfloatKind::PositiveInfinity:
            return "+inf";
        case SfloatKind::NegativeInfinity:
            return "-inf";
    }
    return "nan";
}

const char* pressureUnitLabel(PressureUnit unit) {
    switch (unit) {
        case PressureUnit::MmHg:
            return "mmHg";
        case PressureUnit::KPa:
            return "kPa";
    }
    return "mmHg";
}

ErrorCode decodeBloodPressureMeasurement(const uint8_t* data, size_t length, MeasurementValues& out) {
    if (!data || length < 1) {
        return ErrorCode::TruncatedPayload;
    }

    MeasurementValues values;
    values.flags = data[0];
    values.unit = (values.flags & bpm_flags::kUnitKpa) ? PressureUnit::KPa : PressureUnit::MmHg;

    size_t required = 1 + 3 * kSfloatBytes;
    if (values.flags & bpm_flags::kTimestamp) {
        required += kTimestampBytes;
    }
    if (values.flags & bpm_flags::kPulseRate) {
        required += kSfloatBytes;
    }
    if (values.flags & bpm_flags::kUserId) {
        required += 1;
    }
    if (values.flags & bpm_flags::kMeasurementStatus) {
        required += kStatusBytes;
    }
    if (length < required) {
        return ErrorCode::TruncatedPayload;
    }

    size_t offset = 1;
    values.systolic = decodeSfloat(data[offset], data[offset + 1]);
    offset += kSfloatBytes;
    values.diastolic = decodeSfloat(data[offset], data[offset + 1]);
    offset += kSfloatBytes;
    values.meanArterial = decodeSfloat(data[offset], data[offset + 1]);
    offset += kSfloatBytes;

    if (values.flags & bpm_flags::kTimestamp) {
        DeviceTimestamp ts;
        ts.year = readU16(data + offset);
        ts.month = data[offset + 2];
        ts.day = data[offset + 3];
        ts.hours = data[offset + 4];
        ts.minutes = data[offset + 5];
        ts.seconds = data[offset + 6];
        values.timestamp = ts;
        offset += kTimestampBytes;
    }
    if (values.flags & bpm_flags::kPulseRate) {
        values.pulseRate = decodeSfloat(data[offset], data[offset + 1]);
        offset += kSfloatBytes;
    }
    if (values.flags & bpm_flags::kUserId) {
        values.userId = data[offset];
        offset += 1;
    }
    if (values.flags & bpm_flags::kMeasurementStatus) {
        values.measurementStatus = readU16(data + offset);
        offset += kStatusBytes;
    }

    out = values;
    return ErrorCode::Ok;
}

bool isCuffErrorFrame(const uint8_t* data, size_t length, uint16_t& status) {
    if (!data || length < 5) {
        return false;
    }
    if (data[0] != 0x04 || data[1] != 0xFF) {
        return false;
    }
    status = readU16(data + 3);
    return true;
}

const char* vendorPhaseLabel(VendorPhase phase) {
    switch (phase) {
        case VendorPhase::Inflating:
            return "inflating";
        case VendorPhase::Measuring:
            return "measuring";
        case VendorPhase::Deflating:
            return "deflating";
        case VendorPhase::Aborted:
            return "aborted";
        case VendorPhase::Completed:
            return "completed";
        case VendorPhase::Error:
            return "error";
    }
    return "unknown";
}

ErrorCode decodeVendorFrame(const uint8_t* data, size_t length, VendorEvent& out) {
    if (!data || length == 0) {
        return ErrorCode::TruncatedPayload;
    }

    VendorEvent event;
    event.raw.assign(data, data + length);

    if (data[0] != kVendorPhaseDiscriminator) {
        event.kind = VendorEvent::Kind::Unknown;
        out = std::move(event);
        return ErrorCode::Ok;
    }

    if (length < 2) {
        return ErrorCode::TruncatedPayload;
    }

    switch (data[1]) {
        case static_cast<uint8_t>(VendorPhase::Inflating):
        case static_cast<uint8_t>(VendorPhase::Measuring):
        case static_cast<uint8_t>(VendorPhase::Deflating):
        case static_cast<uint8_t>(VendorPhase::Aborted):
        case static_cast<uint8_t>(VendorPhase::Completed):
        case static_cast<uint8_t>(VendorPhase::Error):
            event.kind = VendorEvent::Kind::PhaseChange;
            event.phase = static_cast<VendorPhase>(data[1]);
            out = std::move(event);
            return ErrorCode::Ok;
        default:
            event.kind = VendorEvent::Kind::Unknown;
            out = std::move(event);
            return ErrorCode::UnrecognizedFrame;
    }
}

std::vector<std::string> decodeMeasurementConditions(uint16_t status) {
    std::vector<std::string> conditions;
    for (size_t bit = 0; bit < sizeof(kConditionNames) / sizeof(kConditionNames[0]); ++bit) {
        if (status & (1U << bit)) {
            conditions.emplace_back(kConditionNames[bit]);
        }
    }
    return conditions;
}

ErrorCode decodeBloodPressureFeature(const uint8_t* data, size_t length, FeatureSupport& out) {
    if (!data || length == 0) {
        return ErrorCode::TruncatedPayload;
    }
    FeatureSupport features;
    features.bitmask = (length >= 2) ? readU16(data) : data[0];
    for (size_t bit = 0; bit < sizeof(kFeatureNames) / sizeof(kFeatureNames[0]); ++bit) {
        if (features.bitmask & (1U << bit)) {
            features.supported.emplace_back(kFeatureNames[bit]);
        }
    }
    out = std::move(features);
    return ErrorCode::Ok;
}

ErrorCode decodeBatteryLevel(const uint8_t* data, size_t length, uint8_t& percent) {
    if (!data || length == 0) {
        return ErrorCode::TruncatedPayload;
    }
    percent = data[0];
    return ErrorCode::Ok;
}

std::string decodeInfoString(const Bytes& raw) {
    bool printable = !raw.empty();
    for (uint8_t c : raw) {
        if (c == 0) {
            continue;
        }
        if (c < 32 || c > 126) {
            printable = false;
            break;
        }
    }
    if (!printable) {
        return toHex(raw.data(), raw.size());
    }

    std::string text;
    text.reserve(raw.size());
    for (uint8_t c : raw) {
        if (c != 0) {
            text.push_back(static_cast<char>(c));
        }
    }
    const size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string toHex(const uint8_t* data, size_t length) {
    static const char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        hex.push_back(kDigits[data[i] >> 4]);
        hex.push_back(kDigits[data[i] & 0x0F]);
    }
    return hex;
}

bool parseHex(const std::string& text, Bytes& out) {
    std::string digits;
    digits.reserve(text.size());
    size_t start = 0;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        start = 2;
    }
    for (size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (c == ' ' || c == ':' || c == '-') {
            continue;
        }
        if (hexNibble(c) < 0) {
            return false;
        }
        digits.push_back(c);
    }
    if (digits.empty() || (digits.size() % 2) != 0) {
        return false;
    }

    Bytes bytes;
    bytes.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        bytes.push_back(static_cast<uint8_t>((hexNibble(digits[i]) << 4) | hexNibble(digits[i + 1])));
    }
    out = std::move(bytes);
    return true;
}

}  // namespace qcardio
