#pragma once

#include <string>

enum class Urgency { Low, Normal, Critical };

// Desktop notifications. Best effort: implementations never fail the caller.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& title, const std::string& message,
                        Urgency urgency = Urgency::Normal) = 0;
};

class NullNotifier : public Notifier {
public:
    void notify(const std::string&, const std::string&, Urgency) override {}
};
