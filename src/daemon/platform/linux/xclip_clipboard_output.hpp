#pragma once

#include "output/output.hpp"

class XclipClipboardOutput : public OutputMethod {
public:
    std::string name() const override { return "clipboard"; }
    std::expected<void, std::string> deliver(const std::string& text) override;
};
