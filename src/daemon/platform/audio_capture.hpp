#pragma once

// Pushes S16_LE mono samples into the RingBuffer it was constructed with
// while capturing.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
};
