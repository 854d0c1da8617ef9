#pragma once

#include <cstdint>
#include <expected>
#include <string>

enum HotkeyModifier : uint32_t {
    kModNone = 0,
    kModCtrl = 1u << 0,
    kModAlt = 1u << 1,
    kModShift = 1u << 2,
    kModSuper = 1u << 3,
};

struct HotkeyChord {
    uint32_t modifiers = kModNone;
    // Lower-case key name: a single character ("v", "1", "/") or a named key
    // ("f12", "space", "enter").
    std::string key;

    bool operator==(const HotkeyChord&) const = default;
};

// Accepts "<ctrl>+<alt>+v" as well as "ctrl+alt+v", case-insensitive.
// Exactly one non-modifier key is required.
std::expected<HotkeyChord, std::string> parse_hotkey(const std::string& spec);

std::string to_string(const HotkeyChord& chord);
