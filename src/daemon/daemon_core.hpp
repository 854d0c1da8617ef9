#pragma once

#include "config.hpp"
#include "output/text_injector.hpp"
#include "platform/notifier.hpp"
#include "recorder.hpp"
#include "session.hpp"
#include "whisper/backend.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Platform-independent daemon logic: owns the busy flag, the session worker
// and the pipeline. The platform event loop feeds it hotkey presses and
// calls on_session_complete() after the worker's notify callback fires.
class DaemonCore {
public:
    // Invoked on the worker thread once a session has finished.
    using NotifyCallback = std::function<void()>;
    using SessionResult = std::expected<SessionOutcome, SessionError>;

    DaemonCore(const Config& config, bool verbose,
               Recorder& recorder, std::unique_ptr<WhisperBackend> backend,
               TextInjector& injector, Notifier& notifier,
               NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Starts a session unless one is running. Returns false if the press was ignored.
    bool on_hotkey();

    // Main thread: reap the worker and return to idle.
    void on_session_complete();

    SessionState session_state() const { return state_.load(std::memory_order_acquire); }
    uint64_t sessions_started() const { return next_session_id_ - 1; }
    const std::optional<SessionResult>& last_result() const { return last_result_; }

    // Interrupts a running session (it ends as Cancelled) and reaps it.
    void shutdown();

private:
    void run_session(std::stop_token stop, uint64_t id);
    void report(uint64_t id, const SessionResult& result);
    void log(const std::string& msg);

    bool verbose_;
    std::unique_ptr<WhisperBackend> backend_;
    Notifier& notifier_;
    NotifyCallback notify_;
    SessionPipeline pipeline_;

    std::atomic<SessionState> state_{SessionState::Idle};
    uint64_t next_session_id_ = 1;

    struct WorkerResult {
        uint64_t id = 0;
        std::optional<SessionResult> result;
    };
    WorkerResult worker_result_;
    std::optional<SessionResult> last_result_;
    std::jthread worker_;
};
