#include "Errors.h"

namespace qcardio {

const char* errorLabel(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:
            return "ok";
        case ErrorCode::NotFound:
            return "not-found";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::LinkError:
            return "link-error";
        case ErrorCode::LinkLost:
            return "link-lost";
        case ErrorCode::NotConnected:
            return "not-connected";
        case ErrorCode::AlreadySubscribed:
            return "already-subscribed";
        case ErrorCode::NotNotifiable:
            return "not-notifiable";
        case ErrorCode::Overrun:
            return "overrun";
        case ErrorCode::WriteRejected:
            return "write-rejected";
        case ErrorCode::ReadFailed:
            return "read-failed";
        case ErrorCode::UnknownCharacteristic:
            return "unknown-characteristic";
        case ErrorCode::TruncatedPayload:
            return "truncated-payload";
        case ErrorCode::UnrecognizedFrame:
            return "unrecognized-frame";
        case ErrorCode::MeasurementTimeout:
            return "measurement-timeout";
        case ErrorCode::NotSupported:
            return "not-supported";
    }
    return "unknown";
}

ErrorKind errorKind(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:
            return ErrorKind::None;
        case ErrorCode::NotFound:
        case ErrorCode::Timeout:
        case ErrorCode::LinkError:
            return ErrorKind::Connect;
        case ErrorCode::LinkLost:
        case ErrorCode::NotConnected:
            return ErrorKind::Link;
        case ErrorCode::AlreadySubscribed:
        case ErrorCode::NotNotifiable:
        case ErrorCode::Overrun:
            return ErrorKind::Subscription;
        case ErrorCode::WriteRejected:
        case ErrorCode::ReadFailed:
        case ErrorCode::UnknownCharacteristic:
            return ErrorKind::Gatt;
        case ErrorCode::TruncatedPayload:
        case ErrorCode::UnrecognizedFrame:
            return ErrorKind::Decode;
        case ErrorCode::MeasurementTimeout:
            return ErrorKind::Measurement;
        case ErrorCode::NotSupported:
            return ErrorKind::Usage;
    }
    return ErrorKind::None;
}

const char* errorKindLabel(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Connect:
            return "connect";
        case ErrorKind::Link:
            return "link";
        case ErrorKind::Subscription:
            return "subscription";
        case ErrorKind::Gatt:
            return "gatt";
        case ErrorKind::Decode:
            return "decode";
        case ErrorKind::Measurement:
            return "measurement";
        case ErrorKind::Usage:
            return "usage";
    }
    return "none";
}

}  // namespace qcardio
