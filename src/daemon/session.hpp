#pragma once

#include "output/text_injector.hpp"
#include "platform/notifier.hpp"
#include "recorder.hpp"
#include "session_error.hpp"
#include "whisper/backend.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>

enum class SessionState { Idle, Recording, Transcribing, Injecting };

constexpr std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Transcribing: return "transcribing";
        case SessionState::Injecting: return "injecting";
    }
    return "unknown";
}

enum class SessionOutcome { Typed, CopiedToClipboard, NoSpeech };

// Everything one hotkey press produces, passed through the pipeline stages
// instead of living on the daemon.
struct SessionContext {
    uint64_t id = 0;
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
    Recording recording;
    std::string audio_path; // removed by the time run() returns
    TranscriptResult transcript;
    InjectionResult injection;
};

struct SessionParams {
    std::string temp_dir = "/tmp";
    size_t min_text_length = 3;
};

// record -> temp WAV -> transcribe -> inject, synchronously on the calling
// thread. The temporary file is scoped to run().
class SessionPipeline {
public:
    using StateCallback = std::function<void(SessionState)>;

    SessionPipeline(Recorder& recorder, WhisperBackend& backend, TextInjector& injector,
                    Notifier& notifier, SessionParams params, bool verbose = false);

    void set_state_callback(StateCallback cb) { on_state_ = std::move(cb); }

    std::expected<SessionOutcome, SessionError> run(SessionContext& ctx, std::stop_token stop);

private:
    void enter(SessionState state);
    void log(const std::string& msg);

    Recorder& recorder_;
    WhisperBackend& backend_;
    TextInjector& injector_;
    Notifier& notifier_;
    SessionParams params_;
    bool verbose_;
    StateCallback on_state_;
};
