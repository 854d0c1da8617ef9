#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <cstdint>
#include <vector>

// Plays a fixed script of samples into the ring as soon as capture starts.
class MockAudioCapture : public AudioCapture {
public:
    explicit MockAudioCapture(RingBuffer& ring, std::vector<int16_t> script = {})
        : ring_(ring), script_(std::move(script)) {}

    bool start() override {
        ++starts_;
        if (fail_start) return false;
        ring_.reset();
        if (!script_.empty()) {
            ring_.write(script_.data(), script_.size() * sizeof(int16_t));
        }
        capturing_ = !die_after_start;
        return true;
    }

    void stop() override {
        ++stops_;
        capturing_ = false;
    }

    bool is_capturing() const override { return capturing_; }

    int starts() const { return starts_; }
    int stops() const { return stops_; }

    bool fail_start = false;
    bool die_after_start = false;

private:
    RingBuffer& ring_;
    std::vector<int16_t> script_;
    bool capturing_ = false;
    int starts_ = 0;
    int stops_ = 0;
};

// Constant-amplitude block: its RMS is |amplitude|.
inline std::vector<int16_t> tone(size_t samples, int16_t amplitude) {
    std::vector<int16_t> out(samples);
    for (size_t i = 0; i < samples; ++i) {
        out[i] = (i % 2 == 0) ? amplitude : static_cast<int16_t>(-amplitude);
    }
    return out;
}

inline std::vector<int16_t> silence(size_t samples) {
    return std::vector<int16_t>(samples, 0);
}

inline void append(std::vector<int16_t>& dst, const std::vector<int16_t>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}
