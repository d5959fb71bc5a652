#pragma once

#include <string>

namespace dictate {

enum class ErrorKind {
    None,

    // Capture
    PermissionDenied,
    NoInputDevice,
    DeviceOpenFailed,
    FileCreateFailed,
    NotRecording,
    MissingRecording,

    // Conversion
    ConversionFailed,

    // Transcription
    MissingWhisperBinary,
    MissingModel,
    ProcessFailed,
    EmptyResult
};

// Short status-line message for each kind
const char* describe_error(ErrorKind kind);

// Identifier used in log lines, e.g. "ProcessFailed"
const char* error_name(ErrorKind kind);

} // namespace dictate
