#pragma once

#include "output.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>

struct InjectionResult {
    std::string method;           // name of the method that delivered
    bool clipboard_fallback = false;
    std::vector<std::string> failures; // "<method>: <error>" for each method tried before it
};

// Fixed fallback chain: each typist once, in order, then the clipboard.
// No method is retried.
class TextInjector {
public:
    TextInjector(std::vector<std::unique_ptr<OutputMethod>> typists,
                 std::unique_ptr<OutputMethod> clipboard,
                 std::chrono::milliseconds typing_delay = std::chrono::milliseconds(0));

    std::expected<InjectionResult, std::string> inject(const std::string& text);

private:
    std::vector<std::unique_ptr<OutputMethod>> typists_;
    std::unique_ptr<OutputMethod> clipboard_;
    std::chrono::milliseconds typing_delay_;
};
