#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"
#include "session_error.hpp"
#include "vad.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>
#include <vector>

enum class StopReason { Silence, MaxDuration };

struct Recording {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 16000;
    StopReason reason = StopReason::Silence;
    bool speech_detected = false;

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

struct RecorderParams {
    VadParams vad;
    uint32_t chunk_samples = 8192;
    double stall_seconds = 5.0;
    std::chrono::milliseconds poll_interval{10};
};

// Pulls fixed-size chunks from the capture ring and runs them through the
// VAD until it says stop. One call is one recording; capture is stopped on
// every return path.
class Recorder {
public:
    // Called once per chunk with its RMS, from the recording thread.
    using ChunkObserver = std::function<void(double rms, bool above_threshold)>;

    Recorder(RingBuffer& ring_buf, AudioCapture& capture, RecorderParams params);

    void set_observer(ChunkObserver observer) { observer_ = std::move(observer); }

    std::expected<Recording, SessionError> record(std::stop_token stop);

private:
    RingBuffer& ring_buf_;
    AudioCapture& capture_;
    RecorderParams params_;
    ChunkObserver observer_;
};
