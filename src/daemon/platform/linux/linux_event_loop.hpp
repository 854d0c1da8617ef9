#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "hotkey.hpp"
#include "output/text_injector.hpp"
#include "platform/linux/notify_send_notifier.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/x11_hotkey_listener.hpp"
#include "recorder.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <memory>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, HotkeyChord chord, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    // False when the loop ended on an error rather than a signal.
    bool run();

private:
    void log(const std::string& msg);

    Config config_;
    HotkeyChord chord_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    RingBuffer ring_buf_;
    PipeWireCapture audio_capture_;
    Recorder recorder_;
    TextInjector injector_;
    std::unique_ptr<Notifier> notifier_;
    X11HotkeyListener hotkey_;

    std::unique_ptr<DaemonCore> core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
