#pragma once

#include "output/output.hpp"

// Types through the XTEST extension. X11 sessions only.
class XdotoolOutput : public OutputMethod {
public:
    explicit XdotoolOutput(bool press_enter = false);
    std::string name() const override { return "xdotool"; }
    std::expected<void, std::string> deliver(const std::string& text) override;

private:
    bool press_enter_;
};
