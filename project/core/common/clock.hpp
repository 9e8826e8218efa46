// core/common/clock.hpp
#pragma once
#include <chrono>

// Monotonic time source threaded into the render loop. Tests substitute
// ManualClock to drive the rotation deterministically.
class IClock {
public:
    virtual ~IClock() = default;
    virtual double now_seconds() const = 0;
};

class SteadyClock : public IClock {
public:
    SteadyClock() : t0_(std::chrono::steady_clock::now()) {}

    double now_seconds() const override
    {
        auto dt = std::chrono::steady_clock::now() - t0_;
        return std::chrono::duration<double>(dt).count();
    }

private:
    std::chrono::steady_clock::time_point t0_;
};

class ManualClock : public IClock {
public:
    double now_seconds() const override { return now_; }

    void set(double t)       { now_ = t; }
    void advance(double dt)  { now_ += dt; }

private:
    double now_{0.0};
};
