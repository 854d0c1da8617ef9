#include "text_injector.hpp"

#include <thread>

TextInjector::TextInjector(std::vector<std::unique_ptr<OutputMethod>> typists,
                           std::unique_ptr<OutputMethod> clipboard,
                           std::chrono::milliseconds typing_delay)
    : typists_(std::move(typists)), clipboard_(std::move(clipboard)),
      typing_delay_(typing_delay) {}

std::expected<InjectionResult, std::string> TextInjector::inject(const std::string& text) {
    if (text.empty()) {
        return std::unexpected("nothing to inject");
    }

    InjectionResult result;

    // Let the user release the hotkey modifiers, or they combine with the typed keys.
    if (!typists_.empty() && typing_delay_.count() > 0) {
        std::this_thread::sleep_for(typing_delay_);
    }

    for (auto& typist : typists_) {
        auto res = typist->deliver(text);
        if (res) {
            result.method = typist->name();
            return result;
        }
        result.failures.push_back(typist->name() + ": " + res.error());
    }

    if (clipboard_) {
        auto res = clipboard_->deliver(text);
        if (res) {
            result.method = clipboard_->name();
            result.clipboard_fallback = true;
            return result;
        }
        result.failures.push_back(clipboard_->name() + ": " + res.error());
    }

    std::string msg = "all methods failed";
    for (const auto& f : result.failures) {
        msg += "; " + f;
    }
    return std::unexpected(msg);
}
