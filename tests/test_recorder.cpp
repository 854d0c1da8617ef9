#include <catch2/catch_test_macros.hpp>

#include "mock_audio_capture.hpp"
#include "recorder.hpp"

#include <chrono>
#include <stop_token>
#include <vector>

namespace {

constexpr uint32_t kChunk = 1600; // 0.1s at 16 kHz

RecorderParams test_params() {
    RecorderParams p;
    p.vad = VadParams{.sample_rate = 16000, .threshold = 400, .silence_seconds = 1.0,
                      .max_seconds = 60, .min_seconds = 0.0};
    p.chunk_samples = kChunk;
    p.stall_seconds = 0.05;
    p.poll_interval = std::chrono::milliseconds(1);
    return p;
}

} // namespace

TEST_CASE("Recorder", "[recorder]") {
    RingBuffer ring(16000 * sizeof(int16_t) * 10);

    SECTION("StopsOnSilenceAfterSpeech") {
        std::vector<int16_t> script;
        append(script, tone(kChunk * 5, 3000));
        append(script, silence(kChunk * 10));
        append(script, tone(kChunk * 5, 3000)); // never reached
        MockAudioCapture capture(ring, script);
        Recorder recorder(ring, capture, test_params());

        auto rec = recorder.record(std::stop_token{});
        REQUIRE(rec.has_value());
        REQUIRE(rec->reason == StopReason::Silence);
        REQUIRE(rec->speech_detected);
        REQUIRE(rec->samples.size() == kChunk * 15);
        REQUIRE(rec->sample_rate == 16000);
        REQUIRE(capture.starts() == 1);
        REQUIRE(capture.stops() >= 1);
    }

    SECTION("KeepsQuietChunksInTheRecording") {
        std::vector<int16_t> script;
        append(script, tone(kChunk, 3000));
        append(script, tone(kChunk * 3, 100));
        append(script, tone(kChunk, 3000));
        append(script, silence(kChunk * 10));
        MockAudioCapture capture(ring, script);
        Recorder recorder(ring, capture, test_params());

        auto rec = recorder.record(std::stop_token{});
        REQUIRE(rec.has_value());
        REQUIRE(rec->samples.size() == script.size());
        REQUIRE(rec->samples[kChunk] == 100);
    }

    SECTION("SilenceOnlyReportsNoSpeech") {
        MockAudioCapture capture(ring, silence(kChunk * 12));
        Recorder recorder(ring, capture, test_params());

        auto rec = recorder.record(std::stop_token{});
        REQUIRE(rec.has_value());
        REQUIRE_FALSE(rec->speech_detected);
        REQUIRE(rec->samples.size() == kChunk * 10);
    }

    SECTION("MaxDuration") {
        auto params = test_params();
        params.vad.max_seconds = 0.5;
        MockAudioCapture capture(ring, tone(kChunk * 10, 3000));
        Recorder recorder(ring, capture, params);

        auto rec = recorder.record(std::stop_token{});
        REQUIRE(rec.has_value());
        REQUIRE(rec->reason == StopReason::MaxDuration);
        REQUIRE(rec->samples.size() == kChunk * 5);
    }

    SECTION("ObserverSeesEveryChunk") {
        std::vector<int16_t> script;
        append(script, tone(kChunk * 2, 3000));
        append(script, silence(kChunk * 10));
        MockAudioCapture capture(ring, script);
        Recorder recorder(ring, capture, test_params());

        std::vector<bool> above;
        recorder.set_observer([&](double, bool loud) { above.push_back(loud); });

        auto rec = recorder.record(std::stop_token{});
        REQUIRE(rec.has_value());
        REQUIRE(above.size() == 12);
        REQUIRE(above[0]);
        REQUIRE(above[1]);
        REQUIRE_FALSE(above[2]);
    }

    SECTION("OpenFailure") {
        MockAudioCapture capture(ring);
        capture.fail_start = true;
        Recorder recorder(ring, capture, test_params());

        auto rec = recorder.record(std::stop_token{});
        REQUIRE_FALSE(rec.has_value());
        REQUIRE(rec.error().kind == ErrorKind::DeviceUnavailable);
    }

    SECTION("CaptureDiesMidRecording") {
        MockAudioCapture capture(ring, tone(kChunk * 2, 3000));
        capture.die_after_start = true;
        Recorder recorder(ring, capture, test_params());

        auto rec = recorder.record(std::stop_token{});
        REQUIRE_FALSE(rec.has_value());
        REQUIRE(rec.error().kind == ErrorKind::DeviceUnavailable);
        REQUIRE(capture.stops() >= 1);
    }

    SECTION("StalledDevice") {
        // Capture claims to run but never delivers a full chunk.
        MockAudioCapture capture(ring, tone(kChunk / 2, 3000));
        Recorder recorder(ring, capture, test_params());

        auto rec = recorder.record(std::stop_token{});
        REQUIRE_FALSE(rec.has_value());
        REQUIRE(rec.error().kind == ErrorKind::DeviceUnavailable);
        REQUIRE(capture.stops() >= 1);
    }

    SECTION("StopRequested") {
        MockAudioCapture capture(ring, tone(kChunk * 50, 3000));
        Recorder recorder(ring, capture, test_params());

        std::stop_source source;
        source.request_stop();
        auto rec = recorder.record(source.get_token());
        REQUIRE_FALSE(rec.has_value());
        REQUIRE(rec.error().kind == ErrorKind::Cancelled);
        REQUIRE(capture.stops() >= 1);
    }
}
