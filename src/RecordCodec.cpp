#include "RecordCodec.h"

#include <algorithm>
#include <cstring>

#include <pb_decode.h>
#include <pb_encode.h>

#include "system/Log.h"

namespace qcardio {

namespace {

const char* sfloatSpecial(SfloatKind kind) {
    switch (kind) {
        case SfloatKind::Value:
            return "";
        case SfloatKind::NaN:
            return "nan";
        case SfloatKind::NotAtThisTime:
            return "nres";
        case SfloatKind::PositiveInfinity:
            return "+inf";
        case SfloatKind::NegativeInfinity:
            return "-inf";
    }
    return "nan";
}

}  // namespace

bool encodeWithLength(const pb_msgdesc_t* fields, const void* src, FrameBuffer& buffer, size_t& totalLen) {
    pb_ostream_t stream = pb_ostream_from_buffer(buffer.data() + kLengthPrefixBytes, kProtoBufferSize);
    if (!pb_encode(&stream, fields, src)) {
        QC_WARN("BRIDGE", "encode error: %s", PB_GET_ERROR(&stream));
        return false;
    }
    const size_t payloadLen = stream.bytes_written;
    if (payloadLen > 0xFFFF) {
        QC_WARN("BRIDGE", "encode error: payload too large");
        return false;
    }
    buffer[0] = static_cast<uint8_t>(payloadLen & 0xFF);
    buffer[1] = static_cast<uint8_t>((payloadLen >> 8) & 0xFF);
    totalLen = payloadLen + kLengthPrefixBytes;
    return true;
}

bool encodeEvent(const com_qcardio_bridge_BridgeEvent& event, FrameBuffer& buffer, size_t& totalLen) {
    return encodeWithLength(com_qcardio_bridge_BridgeEvent_fields, &event, buffer, totalLen);
}

bool unwrapFrame(const uint8_t* frame, size_t length, const uint8_t*& payload, size_t& payloadLength) {
    if (length < kLengthPrefixBytes) {
        QC_WARN("BRIDGE", "<- command too short");
        return false;
    }
    const uint16_t expected = static_cast<uint16_t>(frame[0]) | (static_cast<uint16_t>(frame[1]) << 8);
    const size_t available = length - kLengthPrefixBytes;
    if (expected != available) {
        QC_WARN("BRIDGE", "<- length mismatch");
        return false;
    }
    payload = frame + kLengthPrefixBytes;
    payloadLength = available;
    return true;
}

bool decodeCommand(const uint8_t* payload, size_t length, com_qcardio_bridge_BridgeCommand& out) {
    out = com_qcardio_bridge_BridgeCommand_init_default;
    pb_istream_t stream = pb_istream_from_buffer(payload, length);
    if (!pb_decode(&stream, com_qcardio_bridge_BridgeCommand_fields, &out)) {
        QC_WARN("BRIDGE", "decode error: %s", PB_GET_ERROR(&stream));
        return false;
    }
    return true;
}

void copyString(const std::string& source, char* dest, size_t capacity) {
    if (capacity == 0) {
        return;
    }
    std::memset(dest, 0, capacity);
    std::strncpy(dest, source.c_str(), capacity - 1);
}

com_qcardio_bridge_Phase toProto(Phase phase) {
    switch (phase) {
        case Phase::Idle:
            return com_qcardio_bridge_Phase_PHASE_IDLE;
        case Phase::Inflating:
            return com_qcardio_bridge_Phase_PHASE_INFLATING;
        case Phase::Measuring:
            return com_qcardio_bridge_Phase_PHASE_MEASURING;
        case Phase::Deflating:
            return com_qcardio_bridge_Phase_PHASE_DEFLATING;
        case Phase::Completed:
            return com_qcardio_bridge_Phase_PHASE_COMPLETED;
        case Phase::Aborted:
            return com_qcardio_bridge_Phase_PHASE_ABORTED;
    }
    return com_qcardio_bridge_Phase_PHASE_IDLE;
}

com_qcardio_bridge_Outcome toProto(Outcome outcome) {
    return outcome == Outcome::Completed ? com_qcardio_bridge_Outcome_OUTCOME_COMPLETED
                                         : com_qcardio_bridge_Outcome_OUTCOME_ABORTED;
}

void toProto(const Sfloat& value, com_qcardio_bridge_Sfloat& out) {
    out.value = value.isNumber() ? value.value : 0.0f;
    copyString(sfloatSpecial(value.kind), out.special, sizeof(out.special));
}

void toProto(const MeasurementValues& values, com_qcardio_bridge_MeasurementValues& out) {
    out = com_qcardio_bridge_MeasurementValues_init_default;
    out.flags = values.flags;
    out.unit = values.unit == PressureUnit::KPa ? com_qcardio_bridge_PressureUnit_PRESSURE_UNIT_KPA
                                                : com_qcardio_bridge_PressureUnit_PRESSURE_UNIT_MMHG;
    out.has_systolic = true;
    toProto(values.systolic, out.systolic);
    out.has_diastolic = true;
    toProto(values.diastolic, out.diastolic);
    out.has_mean_arterial = true;
    toProto(values.meanArterial, out.mean_arterial);
    if (values.timestamp) {
        out.has_timestamp = true;
        out.timestamp.year = values.timestamp->year;
        out.timestamp.month = values.timestamp->month;
        out.timestamp.day = values.timestamp->day;
        out.timestamp.hours = values.timestamp->hours;
        out.timestamp.minutes = values.timestamp->minutes;
        out.timestamp.seconds = values.timestamp->seconds;
    }
    if (values.pulseRate) {
        out.has_pulse_rate = true;
        toProto(*values.pulseRate, out.pulse_rate);
    }
    if (values.userId) {
        out.has_user_id = true;
        out.user_id = *values.userId;
    }
    if (values.measurementStatus) {
        out.has_measurement_status = true;
        out.measurement_status = *values.measurementStatus;
    }
}

void toProto(const ProgressEvent& progress, com_qcardio_bridge_ProgressEvent& out) {
    out = com_qcardio_bridge_ProgressEvent_init_default;
    out.phase = toProto(progress.phase);
    if (progress.interim) {
        out.has_interim = true;
        toProto(*progress.interim, out.interim);
    }
}

void toProto(const Record& record, com_qcardio_bridge_RecordEvent& out) {
    out = com_qcardio_bridge_RecordEvent_init_default;
    copyString(record.device.type, out.device_type, sizeof(out.device_type));
    copyString(record.device.address, out.address, sizeof(out.address));
    copyString(record.device.adapter, out.adapter, sizeof(out.adapter));
    out.outcome = toProto(record.outcome);
    if (record.outcome == Outcome::Aborted) {
        copyString(abortReasonLabel(record.reason), out.reason, sizeof(out.reason));
        copyString(record.detail, out.detail, sizeof(out.detail));
    }
    if (record.values) {
        out.has_values = true;
        toProto(*record.values, out.values);
    }
    if (record.batteryPercent) {
        out.has_battery = true;
        out.battery_percent = *record.batteryPercent;
    }
    const size_t maxConditions = sizeof(out.conditions) / sizeof(out.conditions[0]);
    out.conditions_count = static_cast<pb_size_t>(std::min(record.conditions.size(), maxConditions));
    for (pb_size_t i = 0; i < out.conditions_count; ++i) {
        copyString(record.conditions[i], out.conditions[i], sizeof(out.conditions[i]));
    }
    out.captured_at = record.capturedAt;
    out.time_synced = record.timeSynced;
}

void toProto(const FieldList& fields, com_qcardio_bridge_InfoEvent& out) {
    out = com_qcardio_bridge_InfoEvent_init_default;
    const size_t maxFields = sizeof(out.fields) / sizeof(out.fields[0]);
    out.fields_count = static_cast<pb_size_t>(std::min(fields.size(), maxFields));
    for (pb_size_t i = 0; i < out.fields_count; ++i) {
        copyString(fields[i].key, out.fields[i].key, sizeof(out.fields[i].key));
        copyString(fields[i].value, out.fields[i].value, sizeof(out.fields[i].value));
    }
}

void toProto(const FeatureSupport& features, com_qcardio_bridge_FeaturesEvent& out) {
    out = com_qcardio_bridge_FeaturesEvent_init_default;
    out.bitmask = features.bitmask;
    const size_t maxNames = sizeof(out.supported) / sizeof(out.supported[0]);
    out.supported_count = static_cast<pb_size_t>(std::min(features.supported.size(), maxNames));
    for (pb_size_t i = 0; i < out.supported_count; ++i) {
        copyString(features.supported[i], out.supported[i], sizeof(out.supported[i]));
    }
}

void toProto(const DeviceDescriptor& device, com_qcardio_bridge_SettingsEvent& out) {
    out = com_qcardio_bridge_SettingsEvent_init_default;
    copyString(device.type, out.device_type, sizeof(out.device_type));
    copyString(device.address, out.address, sizeof(out.address));
    copyString(device.adapter, out.adapter, sizeof(out.adapter));
    out.scan_timeout_ms = device.scanTimeoutMs;
    out.measure_timeout_ms = device.measureTimeoutMs;
    out.poll_interval_ms = device.pollIntervalMs;
    out.connect_retries = device.connectRetries;
    out.retry_backoff_ms = device.retryBackoffMs;
}

void toProto(ErrorCode code, const char* context, com_qcardio_bridge_ErrorEvent& out) {
    out = com_qcardio_bridge_ErrorEvent_init_default;
    copyString(errorLabel(code), out.code, sizeof(out.code));
    copyString(errorKindLabel(errorKind(code)), out.kind, sizeof(out.kind));
    copyString(context != nullptr ? context : "", out.context, sizeof(out.context));
}

}  // namespace qcardio
