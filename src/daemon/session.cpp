#include "session.hpp"

#include "temp_audio_file.hpp"

#include <format>
#include <print>

namespace {

constexpr const char* kTitle = "Voice Input";

std::string preview(const std::string& text, size_t max_chars = 50) {
    if (text.size() <= max_chars) return text;
    // Do not cut a UTF-8 sequence in half
    size_t cut = max_chars;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + "...";
}

} // namespace

SessionPipeline::SessionPipeline(Recorder& recorder, WhisperBackend& backend,
                                 TextInjector& injector, Notifier& notifier,
                                 SessionParams params, bool verbose)
    : recorder_(recorder), backend_(backend), injector_(injector), notifier_(notifier),
      params_(std::move(params)), verbose_(verbose) {}

std::expected<SessionOutcome, SessionError> SessionPipeline::run(SessionContext& ctx,
                                                                 std::stop_token stop) {
    enter(SessionState::Recording);
    log(std::format("session {}: recording, speak now", ctx.id));
    notifier_.notify(kTitle, "Speak now...", Urgency::Low);

    auto rec = recorder_.record(stop);
    if (!rec) return std::unexpected(rec.error());
    ctx.recording = std::move(*rec);

    log(std::format("session {}: recorded {:.1f}s ({})", ctx.id, ctx.recording.duration_s(),
                    ctx.recording.reason == StopReason::MaxDuration ? "maximum duration reached"
                                                                    : "silence detected"));

    if (!ctx.recording.speech_detected) {
        log(std::format("session {}: no speech detected", ctx.id));
        notifier_.notify(kTitle, "No speech detected");
        return SessionOutcome::NoSpeech;
    }

    auto file = TempAudioFile::create(ctx.recording.samples, ctx.recording.sample_rate,
                                      params_.temp_dir);
    if (!file) {
        return std::unexpected(SessionError{ErrorKind::Io, file.error()});
    }
    ctx.audio_path = file->path();

    enter(SessionState::Transcribing);
    log(std::format("session {}: transcribing with {} backend", ctx.id, backend_.name()));
    notifier_.notify(kTitle, "Transcribing...", Urgency::Low);

    auto tr = backend_.transcribe(file->path(), stop);
    file->remove();
    if (stop.stop_requested()) {
        return std::unexpected(SessionError{ErrorKind::Cancelled, "transcription interrupted"});
    }
    if (!tr) {
        return std::unexpected(SessionError{ErrorKind::InferenceFailed, tr.error()});
    }
    ctx.transcript = std::move(*tr);

    log(std::format("session {}: transcription took {:.1f}s, {} chars", ctx.id,
                    ctx.transcript.processing_s, ctx.transcript.text.size()));

    if (ctx.transcript.text.size() <= params_.min_text_length) {
        log(std::format("session {}: transcript too short, nothing typed", ctx.id));
        notifier_.notify(kTitle, "No speech detected");
        return SessionOutcome::NoSpeech;
    }

    enter(SessionState::Injecting);
    auto inj = injector_.inject(ctx.transcript.text);
    if (!inj) {
        return std::unexpected(SessionError{ErrorKind::InjectionFailed, inj.error()});
    }
    ctx.injection = std::move(*inj);

    for (const auto& failure : ctx.injection.failures) {
        log(std::format("session {}: {}", ctx.id, failure));
    }

    if (ctx.injection.clipboard_fallback) {
        std::println(stderr, "[voice-daemon] typing unavailable, text copied to clipboard");
        notifier_.notify(kTitle, "Copied to clipboard, press Ctrl+V to paste: " +
                                     preview(ctx.transcript.text));
        return SessionOutcome::CopiedToClipboard;
    }

    log(std::format("session {}: typed via {}: {}", ctx.id, ctx.injection.method,
                    preview(ctx.transcript.text)));
    notifier_.notify(kTitle, "✓ " + preview(ctx.transcript.text));
    return SessionOutcome::Typed;
}

void SessionPipeline::enter(SessionState state) {
    if (on_state_) on_state_(state);
}

void SessionPipeline::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voice-daemon] {}", msg);
    }
}
