#include "config.hpp"
#include "hotkey.hpp"
#include "pid_lock.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <csignal>
#include <optional>
#include <print>
#include <string>
#include <unistd.h>

namespace {

void print_usage() {
    std::println("Usage: voice-daemon [options]");
    std::println("Press the hotkey, speak, and the transcript is typed into the focused window.");
    std::println("Options:");
    std::println("  -m, --model SIZE    Whisper model: tiny, base, small, medium (default: small)");
    std::println("  -k, --hotkey CHORD  Global hotkey (default: <ctrl>+<alt>+v)");
    std::println("      --ydotool       Try ydotool before xdotool");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -f, --foreground    Run in foreground (don't daemonize)");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -h, --help          Show this help");
}

} // namespace

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    bool prefer_ydotool = false;
    std::string config_path;
    std::optional<std::string> model;
    std::optional<std::string> hotkey;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) return std::string(argv[++i]);
            std::println(stderr, "voice-daemon: {} requires a value", arg);
            return std::nullopt;
        };

        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--ydotool") {
            prefer_ydotool = true;
        } else if (arg == "--config" || arg == "-c") {
            auto v = value();
            if (!v) return 2;
            config_path = *v;
        } else if (arg == "--model" || arg == "-m") {
            model = value();
            if (!model) return 2;
            if (!Config::is_valid_model(*model)) {
                std::println(stderr, "voice-daemon: invalid model '{}' (choose tiny, base, small, medium)",
                             *model);
                return 2;
            }
        } else if (arg == "--hotkey" || arg == "-k") {
            hotkey = value();
            if (!hotkey) return 2;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::println(stderr, "voice-daemon: unknown option '{}'", arg);
            print_usage();
            return 2;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (model) config.backend.model = *model;
    if (hotkey) config.hotkey = *hotkey;
    if (prefer_ydotool) config.output.prefer = "ydotool";

    if (auto valid = config.validate(); !valid) {
        std::println(stderr, "voice-daemon: {}", valid.error());
        return 2;
    }

    auto chord = parse_hotkey(config.hotkey);
    if (!chord) {
        std::println(stderr, "voice-daemon: {}", chord.error());
        return 2;
    }

    // Taken while stderr and the exit status still reach the caller. The
    // flock()ed descriptor is inherited by the daemonized child.
    auto lock = PidLock::acquire(config.resolved_lock_file());
    if (!lock) {
        std::println(stderr, "lock: {}", lock.error().message);
        return 1;
    }

    if (!foreground) {
        if (!platform::daemonize()) return 1;
        if (auto res = lock->write_pid(); !res) {
            std::println(stderr, "lock: {}", res.error().message);
            return 1;
        }
    }

    // A typing tool that exits early must not take the daemon down with it.
    std::signal(SIGPIPE, SIG_IGN);

    if (verbose) {
        std::println(stderr, "[voice-daemon] Starting (pid {}, model {}, backend {}, hotkey {})",
                     getpid(), config.backend.model, config.backend.type, to_string(*chord));
        std::println(stderr, "[voice-daemon] Stops after {:.1f}s of silence, at most {:.0f}s per recording",
                     config.audio.silence_seconds, config.audio.max_seconds);
        std::println(stderr, "[voice-daemon] Lock file {}", lock->path());
    }

    LinuxEventLoop loop(std::move(config), std::move(*chord), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    return loop.run() ? 0 : 1;
}
