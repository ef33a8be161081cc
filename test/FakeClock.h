#pragma once

#include <functional>

#include "Clock.h"

namespace qcardio {
namespace test {

// Manual clock. sleepMs() advances time and then runs onSleep, which tests
// use to play the peer's side of a conversation.
class FakeClock : public Clock {
public:
    uint64_t nowMs() const override { return now; }
    int64_t epochSeconds() const override { return epoch + static_cast<int64_t>(now / 1000); }
    bool setEpochSeconds(int64_t seconds) override {
        epoch = seconds - static_cast<int64_t>(now / 1000);
        synced = true;
        return true;
    }
    bool wallClockSynced() const override { return synced; }

    void sleepMs(uint32_t ms) override {
        now += ms;
        ++sleeps;
        slept += ms;
        if (onSleep) {
            onSleep();
        }
    }

    uint64_t now = 1000;
    int64_t epoch = 1700000000;
    bool synced = true;
    uint32_t sleeps = 0;
    uint64_t slept = 0;
    std::function<void()> onSleep;
};

}  // namespace test
}  // namespace qcardio
