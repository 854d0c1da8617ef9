#pragma once

#include <expected>
#include <stop_token>
#include <string>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// Speech-to-text capability. Blocking; called from the session worker only.
// `stop` is requested when the daemon shuts down; backends that can abort
// early should honor it.
class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;
    virtual std::string name() const = 0;
    virtual std::expected<TranscriptResult, std::string>
        transcribe(const std::string& wav_path, std::stop_token stop = {}) = 0;
};

inline std::string trim_whitespace(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}
