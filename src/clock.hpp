#pragma once

namespace tollgate {

// Time source for TTL checks, bucket refill and throttling sleeps.
// Injectable so tests can drive time explicitly.
class Clock {
public:
    virtual ~Clock() = default;

    // Fractional Unix epoch seconds.
    virtual double now() = 0;

    virtual void sleep_for(double seconds) = 0;
};

class SystemClock : public Clock {
public:
    double now() override;
    void sleep_for(double seconds) override;
};

} // namespace tollgate
