#include "platform/linux/notify_send_notifier.hpp"

#include "process.hpp"

#include <print>

namespace {

const char* urgency_arg(Urgency u) {
    switch (u) {
        case Urgency::Low: return "low";
        case Urgency::Normal: return "normal";
        case Urgency::Critical: return "critical";
    }
    return "normal";
}

} // namespace

NotifySendNotifier::NotifySendNotifier(bool verbose)
    : verbose_(verbose) {}

void NotifySendNotifier::notify(const std::string& title, const std::string& message,
                                Urgency urgency) {
    auto res = run_process({"notify-send", "-a", "voice-daemon", "-u", urgency_arg(urgency),
                            title, message});
    if (!res && verbose_) {
        std::println(stderr, "[voice-daemon] notification not shown: {}", res.error().message);
    }
}
