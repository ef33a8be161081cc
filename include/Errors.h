#pragma once

#include <cstdint>

namespace qcardio {

enum class ErrorCode : uint8_t {
    Ok = 0,
    // Connect
    NotFound,
    Timeout,
    LinkError,
    // Post-connect link
    LinkLost,
    NotConnected,
    // Subscription
    AlreadySubscribed,
    NotNotifiable,
    Overrun,
    // GATT round-trips
    WriteRejected,
    ReadFailed,
    UnknownCharacteristic,
    // Decode
    TruncatedPayload,
    UnrecognizedFrame,
    // Measurement
    MeasurementTimeout,
    // Usage
    NotSupported,
};

enum class ErrorKind : uint8_t { None, Connect, Link, Subscription, Gatt, Decode, Measurement, Usage };

const char* errorLabel(ErrorCode code);
ErrorKind errorKind(ErrorCode code);
const char* errorKindLabel(ErrorKind kind);

inline bool isOk(ErrorCode code) { return code == ErrorCode::Ok; }

}  // namespace qcardio
