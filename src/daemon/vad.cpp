#include "vad.hpp"

#include <cmath>

namespace {

size_t seconds_to_samples(double seconds, uint32_t sample_rate) {
    if (seconds <= 0.0) return 0;
    return static_cast<size_t>(std::llround(seconds * sample_rate));
}

} // namespace

VoiceActivityDetector::VoiceActivityDetector(const VadParams& params)
    : threshold_(params.threshold),
      silence_limit_(seconds_to_samples(params.silence_seconds, params.sample_rate)),
      max_samples_(seconds_to_samples(params.max_seconds, params.sample_rate)),
      min_samples_(seconds_to_samples(params.min_seconds, params.sample_rate)) {}

double VoiceActivityDetector::rms(std::span<const int16_t> chunk) {
    if (chunk.empty()) return 0.0;
    double sum_squares = 0.0;
    for (int16_t s : chunk) {
        double v = s;
        sum_squares += v * v;
    }
    return std::sqrt(sum_squares / static_cast<double>(chunk.size()));
}

VadDecision VoiceActivityDetector::feed(std::span<const int16_t> chunk) {
    last_rms_ = rms(chunk);
    total_samples_ += chunk.size();

    if (last_rms_ >= threshold_) {
        speech_detected_ = true;
        silence_samples_ = 0;
    } else {
        silence_samples_ += chunk.size();
    }

    if (max_samples_ > 0 && total_samples_ >= max_samples_) {
        return VadDecision::StopMaxDuration;
    }
    if (silence_samples_ >= silence_limit_ && total_samples_ >= min_samples_) {
        return VadDecision::StopSilence;
    }
    return VadDecision::Continue;
}

void VoiceActivityDetector::reset() {
    total_samples_ = 0;
    silence_samples_ = 0;
    last_rms_ = 0.0;
    speech_detected_ = false;
}
