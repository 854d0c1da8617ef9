#pragma once

#include "platform/hotkey_listener.hpp"

// Xlib's Display. <X11/Xlib.h> is only included by the .cpp.
struct _XDisplay;

// XGrabKey on the root window. Needs an X11 session (or XWayland for apps
// that run under it); DISPLAY comes from the environment.
class X11HotkeyListener : public HotkeyListener {
public:
    X11HotkeyListener() = default;
    ~X11HotkeyListener() override;

    X11HotkeyListener(const X11HotkeyListener&) = delete;
    X11HotkeyListener& operator=(const X11HotkeyListener&) = delete;

    std::expected<void, std::string> connect() override;
    std::expected<void, std::string> grab(const HotkeyChord& chord) override;
    int event_fd() const override;
    bool read_events() override;

private:
    void ungrab();

    _XDisplay* display_ = nullptr;
    unsigned long root_ = 0; // Window
    unsigned char keycode_ = 0; // KeyCode
    unsigned int modifiers_ = 0;
    bool grabbed_ = false;
    bool key_down_ = false;
};
