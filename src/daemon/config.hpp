#pragma once

#include <cstdint>
#include <expected>
#include <string>

struct Config {
    struct Backend {
        std::string type = "local"; // "local" (whisper.cpp) or "lan"
        std::string model = "small";
        std::string model_dir;      // empty: <data_dir>/models
        std::string language = "en";
        int threads = 4;
        int beam_size = 5;
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
    } backend;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t chunk_samples = 8192;
        double silence_threshold = 400.0;
        double silence_seconds = 5.0;
        double max_seconds = 3600.0;
        double min_seconds = 0.5;
        uint32_t buffer_seconds = 30;
        double stall_seconds = 5.0;

        // The ring buffer only has to absorb the lag between PipeWire and the
        // recorder, not the whole recording.
        size_t ring_buffer_bytes() const {
            return static_cast<size_t>(buffer_seconds) * sample_rate * sizeof(int16_t);
        }
    } audio;

    struct Output {
        std::string prefer = "xdotool"; // "xdotool" or "ydotool"
        uint32_t typing_delay_ms = 300;
        bool press_enter = true;
        size_t min_text_length = 3;
    } output;

    std::string hotkey = "<ctrl>+<alt>+v";
    bool notifications = true;
    std::string lock_file; // empty: <config_dir>/voice-daemon.pid

    std::expected<void, std::string> validate() const;

    std::string resolved_model_dir() const;
    std::string resolved_lock_file() const;

    static bool is_valid_model(const std::string& model);

    static Config load(const std::string& path);
    static Config load_default();
};
