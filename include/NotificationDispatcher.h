#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "BleTransport.h"
#include "Config.h"
#include "DeviceTypes.h"
#include "Errors.h"
#include "GattRegistry.h"

namespace qcardio {

struct NotificationFrame {
    std::string uuid;
    Bytes data;
    uint32_t sequence = 0;
};

using SubscriptionHandle = uint32_t;
constexpr SubscriptionHandle kNoSubscription = 0;

/**
 * @brief Routes value-changed notifications to one subscriber per characteristic.
 *
 * onTransportFrame() may be called from the BLE host task and only queues.
 * pump() runs on the foreground loop and delivers in arrival order. Each
 * subscription has a bounded queue; frames beyond the bound are counted and
 * reported to the subscription's overrun handler on the next pump().
 */
class NotificationDispatcher {
public:
    using FrameHandler = std::function<void(const NotificationFrame& frame)>;
    using OverrunHandler = std::function<void(const std::string& uuid, uint32_t dropped)>;

    explicit NotificationDispatcher(BleTransport& transport, size_t queueDepth = DISPATCH_QUEUE_DEPTH);

    ErrorCode subscribe(const Characteristic& characteristic, FrameHandler onFrame, OverrunHandler onOverrun,
                        SubscriptionHandle& handle);
    ErrorCode unsubscribe(SubscriptionHandle handle);

    void onTransportFrame(const std::string& uuid, const uint8_t* data, size_t length);

    // Returns the number of frames delivered.
    size_t pump();

    // Connection closed: drop every subscription, queued frame and sequence counter.
    void reset();

    bool subscribed(const std::string& uuid) const;
    size_t subscriptionCount() const;
    uint32_t discardedFrames() const;

private:
    struct Subscription {
        SubscriptionHandle handle = kNoSubscription;
        std::string uuid;
        FrameHandler onFrame;
        OverrunHandler onOverrun;
        size_t queued = 0;
        uint32_t dropped = 0;
    };

    struct Pending {
        SubscriptionHandle handle = kNoSubscription;
        NotificationFrame frame;
    };

    Subscription* findByUuid(const std::string& uuid);
    Subscription* findByHandle(SubscriptionHandle handle);

    BleTransport& transport_;
    const size_t queueDepth_;

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    std::deque<Pending> pending_;
    std::map<std::string, uint32_t> sequences_;
    SubscriptionHandle nextHandle_ = 1;
    uint32_t discarded_ = 0;
};

}  // namespace qcardio
