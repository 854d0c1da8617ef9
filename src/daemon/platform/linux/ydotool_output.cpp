#include "platform/linux/ydotool_output.hpp"

#include "process.hpp"

#include <print>

namespace {

// Linux input event code for KEY_ENTER.
constexpr const char* kEnterPress = "28:1";
constexpr const char* kEnterRelease = "28:0";

} // namespace

YdotoolOutput::YdotoolOutput(bool press_enter)
    : press_enter_(press_enter) {}

std::expected<void, std::string> YdotoolOutput::deliver(const std::string& text) {
    auto res = run_process({"ydotool", "type", "--", text});
    if (!res) return std::unexpected(res.error().message);

    if (press_enter_) {
        res = run_process({"ydotool", "key", kEnterPress, kEnterRelease});
        // Text is delivered at this point; the chain must not type it again.
        if (!res) std::println(stderr, "output: text typed but Enter failed: {}", res.error().message);
    }
    return {};
}
