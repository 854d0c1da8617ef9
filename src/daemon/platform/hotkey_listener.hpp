#pragma once

#include "hotkey.hpp"

#include <expected>
#include <string>

// Global hotkey source that plugs into a poll/epoll loop through event_fd().
class HotkeyListener {
public:
    virtual ~HotkeyListener() = default;
    virtual std::expected<void, std::string> connect() = 0;
    virtual std::expected<void, std::string> grab(const HotkeyChord& chord) = 0;
    virtual int event_fd() const = 0;
    // Drain pending events. Returns true if the chord was pressed at least
    // once; auto-repeat while it is held does not count.
    virtual bool read_events() = 0;
};
