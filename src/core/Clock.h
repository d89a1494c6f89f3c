#pragma once
#include <chrono>

// Time source for cache expiry and summary timestamps.
// Injected so expiry can be driven from tests.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};
