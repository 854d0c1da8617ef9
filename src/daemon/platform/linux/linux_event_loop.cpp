#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/xclip_clipboard_output.hpp"
#include "platform/linux/xdotool_output.hpp"
#include "platform/linux/ydotool_output.hpp"
#include "whisper/lan_backend.hpp"
#include "whisper/local_backend.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <expected>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

RecorderParams recorder_params(const Config& cfg) {
    return RecorderParams{
        .vad = VadParams{
            .sample_rate = cfg.audio.sample_rate,
            .threshold = cfg.audio.silence_threshold,
            .silence_seconds = cfg.audio.silence_seconds,
            .max_seconds = cfg.audio.max_seconds,
            .min_seconds = cfg.audio.min_seconds,
        },
        .chunk_samples = cfg.audio.chunk_samples,
        .stall_seconds = cfg.audio.stall_seconds,
    };
}

TextInjector make_injector(const Config& cfg) {
    std::vector<std::unique_ptr<OutputMethod>> typists;
    bool enter = cfg.output.press_enter;
    if (cfg.output.prefer == "ydotool") {
        typists.push_back(std::make_unique<YdotoolOutput>(enter));
        typists.push_back(std::make_unique<XdotoolOutput>(enter));
    } else {
        typists.push_back(std::make_unique<XdotoolOutput>(enter));
        typists.push_back(std::make_unique<YdotoolOutput>(enter));
    }
    return TextInjector(std::move(typists), std::make_unique<XclipClipboardOutput>(),
                        std::chrono::milliseconds(cfg.output.typing_delay_ms));
}

std::expected<std::unique_ptr<WhisperBackend>, std::string>
make_backend(const Config& cfg, bool verbose) {
    if (cfg.backend.type == "lan") {
        return std::make_unique<LanBackend>(cfg.backend.url, cfg.backend.api_format,
                                            cfg.backend.language);
    }

    auto backend = std::make_unique<LocalBackend>(LocalBackendParams{
        .model_path = cfg.resolved_model_dir() + "/" +
                      LocalBackend::model_file_name(cfg.backend.model),
        .language = cfg.backend.language,
        .threads = cfg.backend.threads,
        .beam_size = cfg.backend.beam_size,
        .verbose = verbose,
    });
    if (auto res = backend->load(); !res) {
        return std::unexpected(res.error());
    }
    return backend;
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, HotkeyChord chord, bool verbose)
    : config_(std::move(config)), chord_(std::move(chord)), verbose_(verbose),
      ring_buf_(config_.audio.ring_buffer_bytes()),
      audio_capture_(ring_buf_, config_.audio.sample_rate),
      recorder_(ring_buf_, audio_capture_, recorder_params(config_)),
      injector_(make_injector(config_)) {
    if (config_.notifications) {
        notifier_ = std::make_unique<NotifySendNotifier>(verbose_);
    } else {
        notifier_ = std::make_unique<NullNotifier>();
    }
}

LinuxEventLoop::~LinuxEventLoop() {
    // The worker may still write the eventfd while being reaped.
    core_.reset();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    // Signals are blocked before any thread exists so that every thread
    // inherits the mask and only the signalfd sees them.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Model load can take seconds; do it before advertising the hotkey.
    log(std::format("Loading {} backend (model {})...", config_.backend.type, config_.backend.model));
    auto backend = make_backend(config_, verbose_);
    if (!backend) {
        std::println(stderr, "whisper: {}", backend.error());
        return false;
    }
    log("Backend ready");

    core_ = std::make_unique<DaemonCore>(
        config_, verbose_, recorder_, std::move(*backend), injector_, *notifier_,
        [this]() {
            uint64_t val = 1;
            if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
            }
        });

    if (auto res = hotkey_.connect(); !res) {
        std::println(stderr, "hotkey: {}", res.error());
        return false;
    }
    if (auto res = hotkey_.grab(chord_); !res) {
        std::println(stderr, "hotkey: {}", res.error());
        return false;
    }
    log("Hotkey " + to_string(chord_) + " grabbed");

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) ||
        !add_fd(hotkey_.event_fd(), EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

bool LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];
    bool ok = true;

    notifier_->notify("Voice Daemon",
                      "Press " + to_string(chord_) + " and speak; recording stops when you do");

    // Xlib may already hold queued events that will never make the fd readable.
    if (hotkey_.read_events()) core_->on_hotkey();

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            ok = false;
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
                    log(std::format("Received {}, shutting down", strsignal(info.ssi_signo)));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) == sizeof(val)) {
                    core_->on_session_complete();
                }
                continue;
            }

            if (fd == hotkey_.event_fd()) {
                if (events[i].events & (EPOLLHUP | EPOLLERR)) {
                    std::println(stderr, "hotkey: X server connection lost");
                    ok = false;
                    running_.store(false, std::memory_order_release);
                    break;
                }
                if (hotkey_.read_events()) {
                    core_->on_hotkey();
                }
                continue;
            }
        }
    }

    core_->shutdown();
    notifier_->notify("Voice Daemon", "Stopped", Urgency::Low);
    return ok;
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voice-daemon] {}", msg);
    }
}
