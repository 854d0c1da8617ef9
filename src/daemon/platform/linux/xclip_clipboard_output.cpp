#include "platform/linux/xclip_clipboard_output.hpp"

#include "process.hpp"

std::expected<void, std::string> XclipClipboardOutput::deliver(const std::string& text) {
    // xclip forks to keep serving the selection, so this returns once stdin is consumed.
    auto res = run_process({"xclip", "-selection", "clipboard"}, text);
    if (!res) return std::unexpected(res.error().message);
    return {};
}
