#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

enum class VadDecision { Continue, StopSilence, StopMaxDuration };

struct VadParams {
    uint32_t sample_rate = 16000;
    double threshold = 400.0;
    double silence_seconds = 5.0;
    double max_seconds = 3600.0;
    double min_seconds = 0.5;
};

// Threshold-and-timer end-of-speech detector. Holds no audio and no clock:
// time is counted in samples fed, so a decision lands within one chunk of the
// configured duration whatever the chunk size.
class VoiceActivityDetector {
public:
    explicit VoiceActivityDetector(const VadParams& params);

    static double rms(std::span<const int16_t> chunk);

    // Account for one chunk and decide whether recording should go on.
    VadDecision feed(std::span<const int16_t> chunk);

    void reset();

    bool speech_detected() const { return speech_detected_; }
    size_t total_samples() const { return total_samples_; }
    size_t silence_samples() const { return silence_samples_; }
    double last_rms() const { return last_rms_; }

private:
    double threshold_;
    size_t silence_limit_;
    size_t max_samples_;
    size_t min_samples_;

    size_t total_samples_ = 0;
    size_t silence_samples_ = 0;
    double last_rms_ = 0.0;
    bool speech_detected_ = false;
};
