#include "hotkey.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace {

constexpr std::array<std::pair<std::string_view, uint32_t>, 10> kModifierNames = {{
    {"ctrl", kModCtrl},   {"control", kModCtrl}, {"ctrl_l", kModCtrl},
    {"alt", kModAlt},     {"alt_l", kModAlt},
    {"shift", kModShift},
    {"super", kModSuper}, {"cmd", kModSuper},    {"win", kModSuper}, {"meta", kModSuper},
}};

constexpr std::array<std::string_view, 22> kNamedKeys = {
    "space", "enter", "return", "tab", "esc", "escape", "backspace", "delete",
    "insert", "home", "end", "page_up", "page_down", "up", "down", "left", "right",
    "pause", "print_screen", "scroll_lock", "menu", "caps_lock",
};

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t");
    return std::string(s.substr(start, end - start + 1));
}

bool is_function_key(const std::string& name) {
    if (name.size() < 2 || name.size() > 3 || name[0] != 'f') return false;
    if (!std::all_of(name.begin() + 1, name.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    int n = std::stoi(name.substr(1));
    return n >= 1 && n <= 24;
}

} // namespace

std::expected<HotkeyChord, std::string> parse_hotkey(const std::string& spec) {
    HotkeyChord chord;

    if (trim(spec).empty()) {
        return std::unexpected("empty hotkey");
    }

    size_t pos = 0;
    while (pos <= spec.size()) {
        size_t plus = spec.find('+', pos);
        // "ctrl++" names the plus key itself
        if (plus == pos && plus + 1 == spec.size()) plus = std::string::npos;
        std::string token = trim(std::string_view(spec).substr(
            pos, plus == std::string::npos ? std::string::npos : plus - pos));
        pos = plus == std::string::npos ? spec.size() + 1 : plus + 1;

        if (token.empty()) {
            return std::unexpected("empty component in hotkey '" + spec + "'");
        }

        bool bracketed = token.size() > 2 && token.front() == '<' && token.back() == '>';
        std::string name = lower(bracketed ? std::string_view(token).substr(1, token.size() - 2)
                                           : std::string_view(token));

        std::string_view name_view = name;
        auto mod = std::ranges::find(kModifierNames, name_view,
                                     &std::pair<std::string_view, uint32_t>::first);
        if (mod != kModifierNames.end()) {
            chord.modifiers |= mod->second;
            continue;
        }

        bool valid_key = name.size() == 1 || is_function_key(name) ||
                         std::ranges::find(kNamedKeys, name_view) != kNamedKeys.end();
        if (!valid_key) {
            return std::unexpected("unknown key '" + token + "' in hotkey '" + spec + "'");
        }
        if (!chord.key.empty()) {
            return std::unexpected("hotkey '" + spec + "' names more than one key");
        }
        chord.key = name == "return" ? "enter" : name == "escape" ? "esc" : name;
    }

    if (chord.key.empty()) {
        return std::unexpected("hotkey '" + spec + "' has no key, only modifiers");
    }
    return chord;
}

std::string to_string(const HotkeyChord& chord) {
    std::string out;
    if (chord.modifiers & kModCtrl) out += "<ctrl>+";
    if (chord.modifiers & kModAlt) out += "<alt>+";
    if (chord.modifiers & kModShift) out += "<shift>+";
    if (chord.modifiers & kModSuper) out += "<super>+";
    out += chord.key.size() == 1 ? chord.key : "<" + chord.key + ">";
    return out;
}
