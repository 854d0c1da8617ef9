#include "platform/linux/xdotool_output.hpp"

#include "process.hpp"

#include <print>

XdotoolOutput::XdotoolOutput(bool press_enter)
    : press_enter_(press_enter) {}

std::expected<void, std::string> XdotoolOutput::deliver(const std::string& text) {
    // 10ms between keystrokes; some toolkits drop keys typed faster.
    auto res = run_process({"xdotool", "type", "--delay", "10", "--", text});
    if (!res) return std::unexpected(res.error().message);

    if (press_enter_) {
        res = run_process({"xdotool", "key", "Return"});
        // Text is delivered at this point; the chain must not type it again.
        if (!res) std::println(stderr, "output: text typed but Return failed: {}", res.error().message);
    }
    return {};
}
