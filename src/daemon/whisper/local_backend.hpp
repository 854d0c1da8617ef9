#pragma once

#include "backend.hpp"

#include <string>

struct whisper_context;

struct LocalBackendParams {
    std::string model_path;
    std::string language = "en"; // "auto" lets whisper detect it
    int threads = 4;
    int beam_size = 5;
    bool verbose = false;
};

// In-process inference with whisper.cpp. The model is loaded once by load()
// and kept for the daemon's lifetime.
class LocalBackend : public WhisperBackend {
public:
    explicit LocalBackend(LocalBackendParams params);
    ~LocalBackend() override;

    LocalBackend(const LocalBackend&) = delete;
    LocalBackend& operator=(const LocalBackend&) = delete;

    std::expected<void, std::string> load();

    std::string name() const override { return "local"; }
    std::expected<TranscriptResult, std::string>
        transcribe(const std::string& wav_path, std::stop_token stop = {}) override;

    // ggml-<size>.bin, the file naming used by whisper.cpp's download script.
    static std::string model_file_name(const std::string& model_size);

private:
    LocalBackendParams params_;
    whisper_context* ctx_ = nullptr;
};
