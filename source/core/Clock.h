#ifndef CLOCK_H
#define CLOCK_H

#include <cstdint>
#include <ctime>

// Seconds since the epoch. Business logic never calls time() directly so that
// transition and staleness logic can run against a controlled clock.
class Clock
{
public:
    virtual ~Clock() {}
    virtual uint64_t now() const = 0;
};

class SystemClock : public Clock
{
public:
    uint64_t now() const override
    {
        return static_cast<uint64_t>(time(nullptr));
    }
};

#endif // CLOCK_H
