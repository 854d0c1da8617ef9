#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <format>
#include <print>

DaemonCore::DaemonCore(const Config& config, bool verbose,
                       Recorder& recorder, std::unique_ptr<WhisperBackend> backend,
                       TextInjector& injector, Notifier& notifier,
                       NotifyCallback notify)
    : verbose_(verbose),
      backend_(std::move(backend)),
      notifier_(notifier),
      notify_(std::move(notify)),
      pipeline_(recorder, *backend_, injector, notifier,
                SessionParams{
                    .temp_dir = platform::temp_dir(),
                    .min_text_length = config.output.min_text_length,
                },
                verbose) {
    pipeline_.set_state_callback([this](SessionState s) {
        state_.store(s, std::memory_order_release);
    });
}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::on_hotkey() {
    if (session_state() != SessionState::Idle) {
        std::println(stderr, "[voice-daemon] hotkey ignored, session busy ({})",
                     to_string(session_state()));
        return false;
    }

    // Claimed here, on the main thread, so a second press can never race the worker.
    state_.store(SessionState::Recording, std::memory_order_release);
    uint64_t id = next_session_id_++;
    log(std::format("Hotkey triggered, starting session {}", id));

    worker_result_ = {};
    worker_ = std::jthread([this, id](std::stop_token stop) { run_session(stop, id); });
    return true;
}

void DaemonCore::run_session(std::stop_token stop, uint64_t id) {
    SessionContext ctx;
    ctx.id = id;
    auto result = pipeline_.run(ctx, stop);

    worker_result_ = WorkerResult{
        .id = id,
        .result = std::move(result),
    };

    notify_();
}

void DaemonCore::on_session_complete() {
    if (worker_.joinable()) {
        worker_.join();
    }

    if (worker_result_.result) {
        report(worker_result_.id, *worker_result_.result);
        last_result_ = std::move(worker_result_.result);
        worker_result_ = {};
    }

    state_.store(SessionState::Idle, std::memory_order_release);
}

void DaemonCore::report(uint64_t id, const SessionResult& result) {
    if (result) {
        log(std::format("Session {} finished", id));
        return;
    }

    const auto& err = result.error();
    if (err.kind == ErrorKind::Cancelled) {
        log(std::format("Session {} cancelled: {}", id, err.message));
        return;
    }

    std::println(stderr, "[voice-daemon] session {} failed ({}): {}", id, to_string(err.kind),
                 err.message);
    // With no typist and no clipboard left the failure stays in the log.
    if (err.kind == ErrorKind::InjectionFailed) return;
    notifier_.notify("Voice Input", std::format("✗ {}: {}", to_string(err.kind), err.message),
                     Urgency::Critical);
}

void DaemonCore::shutdown() {
    if (!worker_.joinable()) return;

    if (session_state() != SessionState::Idle) {
        log("Interrupting active session...");
    }
    worker_.request_stop();
    on_session_complete();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voice-daemon] {}", msg);
    }
}
