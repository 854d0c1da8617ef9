#pragma once

#include "output/output.hpp"

// Types through uinput via ydotoold, so it works under Wayland as well as X11.
class YdotoolOutput : public OutputMethod {
public:
    explicit YdotoolOutput(bool press_enter = false);
    std::string name() const override { return "ydotool"; }
    std::expected<void, std::string> deliver(const std::string& text) override;

private:
    bool press_enter_;
};
