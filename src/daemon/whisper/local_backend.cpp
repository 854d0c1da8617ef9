#include "local_backend.hpp"
#include "../wav.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <print>
#include <vector>
#include <whisper.h>

namespace {

void log_callback(enum ggml_log_level level, const char* text, void* user_data) {
    bool verbose = user_data != nullptr;
    if (verbose || level == GGML_LOG_LEVEL_ERROR) {
        std::print(stderr, "whisper: {}", text);
    }
}

bool abort_callback(void* user_data) {
    return static_cast<const std::stop_token*>(user_data)->stop_requested();
}

std::expected<std::vector<uint8_t>, std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("could not open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (f.bad()) {
        return std::unexpected("read error on " + path);
    }
    return bytes;
}

} // namespace

LocalBackend::LocalBackend(LocalBackendParams params)
    : params_(std::move(params)) {}

LocalBackend::~LocalBackend() {
    if (ctx_) whisper_free(ctx_);
}

std::string LocalBackend::model_file_name(const std::string& model_size) {
    return "ggml-" + model_size + ".bin";
}

std::expected<void, std::string> LocalBackend::load() {
    if (ctx_) return {};

    // A non-null user_data pointer means "verbose".
    whisper_log_set(log_callback, params_.verbose ? this : nullptr);

    std::error_code ec;
    if (!std::filesystem::exists(params_.model_path, ec)) {
        return std::unexpected("model file not found: " + params_.model_path);
    }

    auto cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(params_.model_path.c_str(), cparams);
    if (!ctx_) {
        return std::unexpected("failed to load model " + params_.model_path);
    }
    return {};
}

std::expected<TranscriptResult, std::string>
LocalBackend::transcribe(const std::string& wav_path, std::stop_token stop) {
    auto bytes = read_file(wav_path);
    if (!bytes) return std::unexpected(bytes.error());

    auto pcm = wav::decode(*bytes);
    if (!pcm) return std::unexpected("bad audio file: " + pcm.error());
    if (pcm->sample_rate != WHISPER_SAMPLE_RATE || pcm->channels != 1) {
        return std::unexpected(std::format("expected {} Hz mono audio, got {} Hz x{}",
                                           WHISPER_SAMPLE_RATE, pcm->sample_rate,
                                           pcm->channels));
    }
    if (pcm->samples.empty()) {
        return std::unexpected("empty audio");
    }
    if (!ctx_) {
        return std::unexpected("model not loaded");
    }

    std::vector<float> samples(pcm->samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<float>(pcm->samples[i]) / 32768.0f;
    }
    double duration_s = static_cast<double>(samples.size()) / pcm->sample_rate;

    auto wparams = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);
    wparams.beam_search.beam_size = params_.beam_size;
    wparams.n_threads = params_.threads;
    wparams.language = params_.language.c_str();
    wparams.translate = false;
    wparams.no_timestamps = true;
    wparams.print_progress = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.print_special = false;
    wparams.suppress_blank = true;
    wparams.abort_callback = abort_callback;
    wparams.abort_callback_user_data = &stop;

    auto start = std::chrono::steady_clock::now();
    int rc = whisper_full(ctx_, wparams, samples.data(), static_cast<int>(samples.size()));
    auto end = std::chrono::steady_clock::now();

    if (stop.stop_requested()) {
        return std::unexpected("transcription aborted");
    }
    if (rc != 0) {
        return std::unexpected("whisper_full failed with code " + std::to_string(rc));
    }

    std::string text;
    int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        auto segment = trim_whitespace(whisper_full_get_segment_text(ctx_, i));
        if (segment.empty()) continue;
        if (!text.empty()) text += ' ';
        text += segment;
    }

    return TranscriptResult{
        .text = std::move(text),
        .duration_s = duration_s,
        .processing_s = std::chrono::duration<double>(end - start).count(),
    };
}
