#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <array>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::array<const char*, 4> kModelSizes = {"tiny", "base", "small", "medium"};

// whisper.cpp only accepts 16 kHz input and nothing resamples on the way.
constexpr uint32_t kWhisperSampleRate = 16000;

} // namespace

bool Config::is_valid_model(const std::string& model) {
    return std::ranges::find(kModelSizes, model) != kModelSizes.end();
}

std::expected<void, std::string> Config::validate() const {
    if (!is_valid_model(backend.model)) {
        return std::unexpected("unknown model size '" + backend.model +
                               "' (expected tiny, base, small or medium)");
    }
    if (backend.type != "local" && backend.type != "lan") {
        return std::unexpected("unknown backend type '" + backend.type + "'");
    }
    if (backend.threads <= 0) {
        return std::unexpected("backend.threads must be positive");
    }
    if (audio.sample_rate == 0 || audio.chunk_samples == 0) {
        return std::unexpected("audio.sample_rate and audio.chunk_samples must be non-zero");
    }
    if (backend.type == "local" && audio.sample_rate != kWhisperSampleRate) {
        return std::unexpected("audio.sample_rate must be " + std::to_string(kWhisperSampleRate) +
                               " with the local backend");
    }
    if (audio.ring_buffer_bytes() < static_cast<size_t>(audio.chunk_samples) * sizeof(int16_t)) {
        return std::unexpected("audio.buffer_seconds is too small to hold one chunk of " +
                               std::to_string(audio.chunk_samples) + " samples");
    }
    if (audio.silence_seconds <= 0.0) {
        return std::unexpected("audio.silence_seconds must be positive");
    }
    if (audio.max_seconds <= audio.min_seconds) {
        return std::unexpected("audio.max_seconds must exceed audio.min_seconds");
    }
    if (output.prefer != "xdotool" && output.prefer != "ydotool") {
        return std::unexpected("unknown output.prefer '" + output.prefer + "'");
    }
    return {};
}

std::string Config::resolved_model_dir() const {
    if (!backend.model_dir.empty()) return backend.model_dir;
    auto dir = platform::data_dir();
    if (dir.empty()) return "/tmp/voice-daemon/models";
    return dir + "/models";
}

std::string Config::resolved_lock_file() const {
    if (!lock_file.empty()) return lock_file;
    auto dir = platform::config_dir();
    if (dir.empty()) return "/tmp/voice-daemon.pid";
    return dir + "/voice-daemon.pid";
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) cfg.backend.type = b["type"].get<std::string>();
            if (b.contains("model")) cfg.backend.model = b["model"].get<std::string>();
            if (b.contains("model_dir")) cfg.backend.model_dir = b["model_dir"].get<std::string>();
            if (b.contains("language")) cfg.backend.language = b["language"].get<std::string>();
            if (b.contains("threads")) cfg.backend.threads = b["threads"].get<int>();
            if (b.contains("beam_size")) cfg.backend.beam_size = b["beam_size"].get<int>();
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("api_format")) cfg.backend.api_format = b["api_format"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("chunk_samples")) cfg.audio.chunk_samples = a["chunk_samples"].get<uint32_t>();
            if (a.contains("silence_threshold")) cfg.audio.silence_threshold = a["silence_threshold"].get<double>();
            if (a.contains("silence_seconds")) cfg.audio.silence_seconds = a["silence_seconds"].get<double>();
            if (a.contains("max_seconds")) cfg.audio.max_seconds = a["max_seconds"].get<double>();
            if (a.contains("min_seconds")) cfg.audio.min_seconds = a["min_seconds"].get<double>();
            if (a.contains("buffer_seconds")) cfg.audio.buffer_seconds = a["buffer_seconds"].get<uint32_t>();
            if (a.contains("stall_seconds")) cfg.audio.stall_seconds = a["stall_seconds"].get<double>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("prefer")) cfg.output.prefer = o["prefer"].get<std::string>();
            if (o.contains("typing_delay_ms")) cfg.output.typing_delay_ms = o["typing_delay_ms"].get<uint32_t>();
            if (o.contains("press_enter")) cfg.output.press_enter = o["press_enter"].get<bool>();
            if (o.contains("min_text_length")) cfg.output.min_text_length = o["min_text_length"].get<size_t>();
        }

        if (j.contains("hotkey")) cfg.hotkey = j["hotkey"].get<std::string>();
        if (j.contains("notifications")) cfg.notifications = j["notifications"].get<bool>();
        if (j.contains("lock_file")) cfg.lock_file = j["lock_file"].get<std::string>();

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
