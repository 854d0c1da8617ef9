#include "recorder.hpp"

#include <format>
#include <thread>

namespace {

struct CaptureGuard {
    AudioCapture& capture;
    ~CaptureGuard() { capture.stop(); }
};

} // namespace

Recorder::Recorder(RingBuffer& ring_buf, AudioCapture& capture, RecorderParams params)
    : ring_buf_(ring_buf), capture_(capture), params_(std::move(params)) {}

std::expected<Recording, SessionError> Recorder::record(std::stop_token stop) {
    if (!capture_.start()) {
        return std::unexpected(SessionError{ErrorKind::DeviceUnavailable,
                                            "failed to open audio capture"});
    }
    CaptureGuard guard{capture_};

    VoiceActivityDetector vad(params_.vad);
    Recording rec;
    rec.sample_rate = params_.vad.sample_rate;

    std::vector<int16_t> chunk(params_.chunk_samples);
    auto stall_limit = std::chrono::duration<double>(params_.stall_seconds);
    auto last_chunk = std::chrono::steady_clock::now();

    while (true) {
        if (stop.stop_requested()) {
            return std::unexpected(SessionError{ErrorKind::Cancelled, "recording interrupted"});
        }

        if (!ring_buf_.read_samples(chunk)) {
            auto idle = std::chrono::steady_clock::now() - last_chunk;
            if (!capture_.is_capturing()) {
                return std::unexpected(SessionError{ErrorKind::DeviceUnavailable,
                                                    "audio capture stopped unexpectedly"});
            }
            if (idle > stall_limit) {
                return std::unexpected(SessionError{
                    ErrorKind::DeviceUnavailable,
                    std::format("no audio from capture device for {:.1f}s", params_.stall_seconds)});
            }
            std::this_thread::sleep_for(params_.poll_interval);
            continue;
        }
        last_chunk = std::chrono::steady_clock::now();

        rec.samples.insert(rec.samples.end(), chunk.begin(), chunk.end());
        auto decision = vad.feed(chunk);
        if (observer_) observer_(vad.last_rms(), vad.silence_samples() == 0);

        if (decision == VadDecision::StopSilence) {
            rec.reason = StopReason::Silence;
            break;
        }
        if (decision == VadDecision::StopMaxDuration) {
            rec.reason = StopReason::MaxDuration;
            break;
        }
    }

    rec.speech_detected = vad.speech_detected();
    return rec;
}
