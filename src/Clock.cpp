#include "Clock.h"

#ifdef ARDUINO
#include <Arduino.h>
#include <esp_task_wdt.h>
#include <esp_timer.h>
#include <sys/time.h>

#include <ctime>

#include "Config.h"

namespace qcardio {

// esp_timer is 64-bit; millis() wraps after ~49.7 days.
uint64_t SystemClock::nowMs() const {
    return static_cast<uint64_t>(esp_timer_get_time() / 1000);
}

int64_t SystemClock::epochSeconds() const {
    return static_cast<int64_t>(time(nullptr));
}

bool SystemClock::setEpochSeconds(int64_t epoch) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(epoch);
    return settimeofday(&tv, nullptr) == 0;
}

// The RTC starts at 1970 after power-on; anything before MIN_VALID_EPOCH_S
// has never been set.
bool SystemClock::wallClockSynced() const {
    return epochSeconds() >= MIN_VALID_EPOCH_S;
}

// Every blocking wait in the engine sleeps through here, so this is where
// the loop task keeps the watchdog fed.
void SystemClock::sleepMs(uint32_t ms) {
    esp_task_wdt_reset();
    delay(ms);
}

}  // namespace qcardio

#else

#include <chrono>
#include <thread>

namespace qcardio {

uint64_t SystemClock::nowMs() const {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

int64_t SystemClock::epochSeconds() const {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count()) +
           offsetSeconds_;
}

bool SystemClock::setEpochSeconds(int64_t epoch) {
    using namespace std::chrono;
    const int64_t system = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
    offsetSeconds_ = epoch - system;
    return true;
}

bool SystemClock::wallClockSynced() const {
    return true;
}

void SystemClock::sleepMs(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace qcardio

#endif  // ARDUINO
