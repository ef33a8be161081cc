#pragma once

#include <cstdint>

namespace qcardio {

class Clock {
public:
    virtual ~Clock() = default;

    // Monotonic milliseconds.
    virtual uint64_t nowMs() const = 0;
    // Wall clock, seconds since the Unix epoch.
    virtual int64_t epochSeconds() const = 0;
    virtual bool setEpochSeconds(int64_t seconds) = 0;
    // False until the wall clock has been set from a trusted source.
    virtual bool wallClockSynced() const = 0;
    virtual void sleepMs(uint32_t ms) = 0;
};

// esp_timer/delay()/time() on the bridge, std::chrono on host builds.
class SystemClock : public Clock {
public:
    uint64_t nowMs() const override;
    int64_t epochSeconds() const override;
    bool setEpochSeconds(int64_t seconds) override;
    bool wallClockSynced() const override;
    void sleepMs(uint32_t ms) override;

private:
#ifndef ARDUINO
    int64_t offsetSeconds_ = 0;
#endif
};

}  // namespace qcardio
