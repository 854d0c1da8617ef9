#pragma once

#include "backend.hpp"

#include <string>

// Sends the recording to a whisper.cpp server or an OpenAI-compatible
// transcription endpoint on the local network.
class LanBackend : public WhisperBackend {
public:
    // api_format: "whisper.cpp" or "openai"
    LanBackend(std::string url, std::string api_format = "whisper.cpp",
               std::string language = "en");
    ~LanBackend() override;

    std::string name() const override { return "lan"; }
    std::expected<TranscriptResult, std::string>
        transcribe(const std::string& wav_path, std::stop_token stop = {}) override;

private:
    std::string url_;
    std::string api_format_;
    std::string language_;
};
