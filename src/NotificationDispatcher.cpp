#include "NotificationDispatcher.h"

#include <algorithm>
#include <utility>

#include "system/Log.h"

namespace qcardio {

NotificationDispatcher::NotificationDispatcher(BleTransport& transport, size_t queueDepth)
    : transport_(transport), queueDepth_(queueDepth == 0 ? 1 : queueDepth) {}

NotificationDispatcher::Subscription* NotificationDispatcher::findByUuid(const std::string& uuid) {
    for (auto& sub : subscriptions_) {
        if (sub.uuid == uuid) {
            return &sub;
        }
    }
    return nullptr;
}

NotificationDispatcher::Subscription* NotificationDispatcher::findByHandle(SubscriptionHandle handle) {
    for (auto& sub : subscriptions_) {
        if (sub.handle == handle) {
            return &sub;
        }
    }
    return nullptr;
}

ErrorCode NotificationDispatcher::subscribe(const Characteristic& characteristic, FrameHandler onFrame,
                                            OverrunHandler onOverrun, SubscriptionHandle& handle) {
    handle = kNoSubscription;
    if (!characteristic.canNotify()) {
        return ErrorCode::NotNotifiable;
    }
    const std::string uuid = normalizeUuid(characteristic.uuid);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (findByUuid(uuid) != nullptr) {
            return ErrorCode::AlreadySubscribed;
        }
    }

    const ErrorCode rc = transport_.setNotifications(uuid, true);
    if (!isOk(rc)) {
        QC_WARN("DISPATCH", "enable notifications on %s failed: %s", uuid.c_str(), errorLabel(rc));
        return rc;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Subscription sub;
    sub.handle = nextHandle_++;
    sub.uuid = uuid;
    sub.onFrame = std::move(onFrame);
    sub.onOverrun = std::move(onOverrun);
    handle = sub.handle;
    subscriptions_.push_back(std::move(sub));
    QC_LOG("DISPATCH", "subscribed %s handle=%u", uuid.c_str(), static_cast<unsigned>(handle));
    return ErrorCode::Ok;
}

ErrorCode NotificationDispatcher::unsubscribe(SubscriptionHandle handle) {
    if (handle == kNoSubscription) {
        return ErrorCode::Ok;
    }
    std::string uuid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                               [handle](const Subscription& sub) { return sub.handle == handle; });
        if (it == subscriptions_.end()) {
            return ErrorCode::Ok;
        }
        uuid = it->uuid;
        subscriptions_.erase(it);
    }

    const ErrorCode rc = transport_.setNotifications(uuid, false);
    if (!isOk(rc)) {
        QC_WARN("DISPATCH", "disable notifications on %s failed: %s", uuid.c_str(), errorLabel(rc));
    }
    return rc;
}

void NotificationDispatcher::onTransportFrame(const std::string& uuid, const uint8_t* data, size_t length) {
    const std::string key = normalizeUuid(uuid);
    std::lock_guard<std::mutex> lock(mutex_);
    const uint32_t sequence = ++sequences_[key];
    Subscription* sub = findByUuid(key);
    if (sub == nullptr) {
        ++discarded_;
        QC_LOG("DISPATCH", "no subscriber for %s, frame %u discarded", key.c_str(), static_cast<unsigned>(sequence));
        return;
    }
    if (sub->queued >= queueDepth_) {
        ++sub->dropped;
        return;
    }
    Pending pending;
    pending.handle = sub->handle;
    pending.frame.uuid = key;
    pending.frame.data.assign(data, data + length);
    pending.frame.sequence = sequence;
    pending_.push_back(std::move(pending));
    ++sub->queued;
}

size_t NotificationDispatcher::pump() {
    size_t delivered = 0;
    size_t budget;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        budget = pending_.size();
    }

    while (budget-- > 0) {
        FrameHandler handler;
        NotificationFrame frame;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.empty()) {
                break;
            }
            Pending next = std::move(pending_.front());
            pending_.pop_front();
            Subscription* sub = findByHandle(next.handle);
            if (sub == nullptr) {
                // Unsubscribed while the frame was queued.
                continue;
            }
            --sub->queued;
            handler = sub->onFrame;
            frame = std::move(next.frame);
        }
        if (handler) {
            handler(frame);
        }
        ++delivered;
    }

    std::vector<std::pair<OverrunHandler, std::pair<std::string, uint32_t>>> overruns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& sub : subscriptions_) {
            if (sub.dropped > 0) {
                overruns.push_back({sub.onOverrun, {sub.uuid, sub.dropped}});
                sub.dropped = 0;
            }
        }
    }
    for (auto& overrun : overruns) {
        QC_WARN("DISPATCH", "overrun on %s, %u frames dropped", overrun.second.first.c_str(),
                static_cast<unsigned>(overrun.second.second));
        if (overrun.first) {
            overrun.first(overrun.second.first, overrun.second.second);
        }
    }
    return delivered;
}

void NotificationDispatcher::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.clear();
    pending_.clear();
    sequences_.clear();
}

bool NotificationDispatcher::subscribed(const std::string& uuid) const {
    const std::string key = normalizeUuid(uuid);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sub : subscriptions_) {
        if (sub.uuid == key) {
            return true;
        }
    }
    return false;
}

size_t NotificationDispatcher::subscriptionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

uint32_t NotificationDispatcher::discardedFrames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discarded_;
}

}  // namespace qcardio
