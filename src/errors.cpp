#include "errors.hpp"

namespace dictate {

const char* describe_error(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "OK";
        case ErrorKind::PermissionDenied: return "Microphone access denied";
        case ErrorKind::NoInputDevice: return "No input device available";
        case ErrorKind::DeviceOpenFailed: return "Failed to start recording";
        case ErrorKind::FileCreateFailed: return "Failed to create recording file";
        case ErrorKind::NotRecording: return "Not recording";
        case ErrorKind::MissingRecording: return "Recording file missing";
        case ErrorKind::ConversionFailed: return "Audio conversion failed";
        case ErrorKind::MissingWhisperBinary: return "Whisper binary not found";
        case ErrorKind::MissingModel: return "Whisper model not found";
        case ErrorKind::ProcessFailed: return "Whisper process failed";
        case ErrorKind::EmptyResult: return "No transcript produced";
    }
    return "Unknown error";
}

const char* error_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::NoInputDevice: return "NoInputDevice";
        case ErrorKind::DeviceOpenFailed: return "DeviceOpenFailed";
        case ErrorKind::FileCreateFailed: return "FileCreateFailed";
        case ErrorKind::NotRecording: return "NotRecording";
        case ErrorKind::MissingRecording: return "MissingRecording";
        case ErrorKind::ConversionFailed: return "ConversionFailed";
        case ErrorKind::MissingWhisperBinary: return "MissingWhisperBinary";
        case ErrorKind::MissingModel: return "MissingModel";
        case ErrorKind::ProcessFailed: return "ProcessFailed";
        case ErrorKind::EmptyResult: return "EmptyResult";
    }
    return "Unknown";
}

} // namespace dictate
