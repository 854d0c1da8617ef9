#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    DeviceUnavailable, // microphone could not be opened or went silent
    Io,                // temporary audio file
    InferenceFailed,
    InjectionFailed,   // every method including the clipboard
    Cancelled,         // daemon shutting down
};

struct SessionError {
    ErrorKind kind;
    std::string message;
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DeviceUnavailable: return "device unavailable";
        case ErrorKind::Io: return "i/o error";
        case ErrorKind::InferenceFailed: return "transcription failed";
        case ErrorKind::InjectionFailed: return "injection failed";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}
