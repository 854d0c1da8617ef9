#pragma once

#include "platform/notifier.hpp"

class NotifySendNotifier : public Notifier {
public:
    explicit NotifySendNotifier(bool verbose = false);
    void notify(const std::string& title, const std::string& message,
                Urgency urgency = Urgency::Normal) override;

private:
    bool verbose_;
};
