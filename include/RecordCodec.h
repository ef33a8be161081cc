#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <pb.h>

#include "DevicePlugin.h"
#include "DeviceTypes.h"
#include "Errors.h"
#include "GattRegistry.h"
#include "MeasurementStateMachine.h"
#include "ResultAssembler.h"
#include "ValueCodec.h"
#include "proto/qcardio.pb.h"

namespace qcardio {

constexpr size_t kProtoBufferSize = 512;
constexpr size_t kLengthPrefixBytes = 2;

using FrameBuffer = std::array<uint8_t, kLengthPrefixBytes + kProtoBufferSize>;

// [len lo][len hi][protobuf]
bool encodeWithLength(const pb_msgdesc_t* fields, const void* src, FrameBuffer& buffer, size_t& totalLen);
bool encodeEvent(const com_qcardio_bridge_BridgeEvent& event, FrameBuffer& buffer, size_t& totalLen);

// Checks the length prefix and returns the protobuf payload inside `frame`.
bool unwrapFrame(const uint8_t* frame, size_t length, const uint8_t*& payload, size_t& payloadLength);
bool decodeCommand(const uint8_t* payload, size_t length, com_qcardio_bridge_BridgeCommand& out);

void copyString(const std::string& source, char* dest, size_t capacity);

com_qcardio_bridge_Phase toProto(Phase phase);
com_qcardio_bridge_Outcome toProto(Outcome outcome);
void toProto(const Sfloat& value, com_qcardio_bridge_Sfloat& out);
void toProto(const MeasurementValues& values, com_qcardio_bridge_MeasurementValues& out);
void toProto(const ProgressEvent& progress, com_qcardio_bridge_ProgressEvent& out);
void toProto(const Record& record, com_qcardio_bridge_RecordEvent& out);
void toProto(const FieldList& fields, com_qcardio_bridge_InfoEvent& out);
void toProto(const FeatureSupport& features, com_qcardio_bridge_FeaturesEvent& out);
void toProto(const DeviceDescriptor& device, com_qcardio_bridge_SettingsEvent& out);
void toProto(ErrorCode code, const char* context, com_qcardio_bridge_ErrorEvent& out);

}  // namespace qcardio
