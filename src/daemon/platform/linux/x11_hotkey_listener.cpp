#include "platform/linux/x11_hotkey_listener.hpp"

#include <X11/XKBlib.h>
#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <array>
#include <atomic>
#include <cctype>
#include <string_view>
#include <utility>

namespace {

// Xlib reports grab conflicts asynchronously through a process-wide handler.
std::atomic<int> g_grab_error{0};

int grab_error_handler(Display*, XErrorEvent* ev) {
    g_grab_error.store(ev->error_code, std::memory_order_relaxed);
    return 0;
}

// NumLock (Mod2) and CapsLock must not defeat the grab, so every
// combination of them is grabbed as well.
constexpr std::array<unsigned int, 4> kLockVariants = {
    0, LockMask, Mod2Mask, LockMask | Mod2Mask,
};

constexpr std::array<std::pair<std::string_view, KeySym>, 20> kNamedKeysyms = {{
    {"space", XK_space},          {"enter", XK_Return},         {"tab", XK_Tab},
    {"esc", XK_Escape},           {"backspace", XK_BackSpace},  {"delete", XK_Delete},
    {"insert", XK_Insert},        {"home", XK_Home},            {"end", XK_End},
    {"page_up", XK_Prior},        {"page_down", XK_Next},       {"up", XK_Up},
    {"down", XK_Down},            {"left", XK_Left},            {"right", XK_Right},
    {"pause", XK_Pause},          {"print_screen", XK_Print},   {"scroll_lock", XK_Scroll_Lock},
    {"menu", XK_Menu},            {"caps_lock", XK_Caps_Lock},
}};

KeySym keysym_for(const std::string& key) {
    if (key.size() == 1) {
        // Latin-1 keysyms coincide with their character codes.
        auto c = static_cast<unsigned char>(key[0]);
        return std::isprint(c) ? static_cast<KeySym>(c) : NoSymbol;
    }
    if (key[0] == 'f') {
        std::string name = "F" + key.substr(1);
        return XStringToKeysym(name.c_str());
    }
    for (const auto& [name, sym] : kNamedKeysyms) {
        if (name == key) return sym;
    }
    return NoSymbol;
}

unsigned int x11_modifiers(uint32_t mods) {
    unsigned int mask = 0;
    if (mods & kModCtrl) mask |= ControlMask;
    if (mods & kModAlt) mask |= Mod1Mask;
    if (mods & kModShift) mask |= ShiftMask;
    if (mods & kModSuper) mask |= Mod4Mask;
    return mask;
}

} // namespace

X11HotkeyListener::~X11HotkeyListener() {
    if (display_) {
        ungrab();
        XCloseDisplay(display_);
    }
}

std::expected<void, std::string> X11HotkeyListener::connect() {
    if (display_) return {};

    display_ = XOpenDisplay(nullptr);
    if (!display_) {
        return std::unexpected("cannot open X display (is DISPLAY set?)");
    }
    root_ = DefaultRootWindow(display_);

    // Holding the chord then yields repeated KeyPress without KeyRelease in
    // between, which read_events() filters out.
    Bool supported = False;
    XkbSetDetectableAutoRepeat(display_, True, &supported);
    return {};
}

std::expected<void, std::string> X11HotkeyListener::grab(const HotkeyChord& chord) {
    if (!display_) return std::unexpected("not connected");

    KeySym sym = keysym_for(chord.key);
    if (sym == NoSymbol) {
        return std::unexpected("no X keysym for key '" + chord.key + "'");
    }
    KeyCode code = XKeysymToKeycode(display_, sym);
    if (code == 0) {
        return std::unexpected("key '" + chord.key + "' is not on the current keyboard layout");
    }

    ungrab();
    keycode_ = code;
    modifiers_ = x11_modifiers(chord.modifiers);

    g_grab_error.store(0, std::memory_order_relaxed);
    auto* previous = XSetErrorHandler(grab_error_handler);
    for (unsigned int lock : kLockVariants) {
        XGrabKey(display_, keycode_, modifiers_ | lock, root_, False, GrabModeAsync, GrabModeAsync);
    }
    XSync(display_, False);
    XSetErrorHandler(previous);

    if (int err = g_grab_error.load(std::memory_order_relaxed); err != 0) {
        grabbed_ = true; // release whatever variants did succeed
        ungrab();
        if (err == BadAccess) {
            return std::unexpected("hotkey " + to_string(chord) + " is already grabbed by another client");
        }
        return std::unexpected("XGrabKey failed with X error " + std::to_string(err));
    }

    grabbed_ = true;
    return {};
}

void X11HotkeyListener::ungrab() {
    if (!grabbed_ || !display_) return;
    for (unsigned int lock : kLockVariants) {
        XUngrabKey(display_, keycode_, modifiers_ | lock, root_);
    }
    XFlush(display_);
    grabbed_ = false;
    key_down_ = false;
}

int X11HotkeyListener::event_fd() const {
    return display_ ? ConnectionNumber(display_) : -1;
}

bool X11HotkeyListener::read_events() {
    if (!display_) return false;

    bool triggered = false;
    while (XPending(display_) > 0) {
        XEvent ev;
        XNextEvent(display_, &ev);

        if (ev.type == KeyPress && ev.xkey.keycode == keycode_) {
            if (!key_down_) triggered = true;
            key_down_ = true;
        } else if (ev.type == KeyRelease && ev.xkey.keycode == keycode_) {
            key_down_ = false;
        }
    }
    return triggered;
}
