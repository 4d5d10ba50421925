#include "core/EventBus.h"

#include <algorithm>
#include <utility>

namespace core {

EventBus::Subscription::Subscription(EventBus* bus, Kind kind, std::size_t id)
    : bus_(bus), kind_(kind), id_(id) {}

EventBus::Subscription::~Subscription() {
    reset();
}

EventBus::Subscription::Subscription(Subscription&& other) noexcept {
    bus_ = other.bus_;
    kind_ = other.kind_;
    id_ = other.id_;
    other.bus_ = nullptr;
    other.kind_ = Kind::None;
    other.id_ = 0;
}

EventBus::Subscription& EventBus::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        bus_ = other.bus_;
        kind_ = other.kind_;
        id_ = other.id_;
        other.bus_ = nullptr;
        other.kind_ = Kind::None;
        other.id_ = 0;
    }
    return *this;
}

void EventBus::Subscription::reset() {
    if (bus_ && id_ != 0) {
        switch (kind_) {
        case Kind::Series:
            bus_->unsubscribeSeries(id_);
            break;
        case Kind::Status:
            bus_->unsubscribeStatus(id_);
            break;
        case Kind::None:
            break;
        }
    }
    bus_ = nullptr;
    kind_ = Kind::None;
    id_ = 0;
}

template <typename Callback, typename Event>
void EventBus::dispatch(std::vector<CallbackData<Callback>>& listeners, const Event& event) {
    // Listeners subscribed during this round are not notified until the next publish.
    const std::size_t count = listeners.size();
    ++dispatchDepth_;
    for (std::size_t idx = 0; idx < count; ++idx) {
        if (listeners[idx].id == 0) {
            continue;
        }
        auto callback = listeners[idx].callback;
        if (callback) {
            callback(event);
        }
    }
    --dispatchDepth_;
    if (dispatchDepth_ == 0 && needsCompaction_) {
        compact();
    }
}

template <typename Callback>
void EventBus::erase(std::vector<CallbackData<Callback>>& listeners, std::size_t id) {
    auto it = std::find_if(listeners.begin(), listeners.end(),
                           [id](const CallbackData<Callback>& data) { return data.id == id; });
    if (it == listeners.end()) {
        return;
    }
    if (dispatchDepth_ > 0) {
        it->id = 0;
        it->callback = nullptr;
        needsCompaction_ = true;
        return;
    }
    listeners.erase(it);
}

void EventBus::compact() {
    auto dead = [](const auto& data) { return data.id == 0; };
    seriesListeners_.erase(std::remove_if(seriesListeners_.begin(), seriesListeners_.end(), dead),
                           seriesListeners_.end());
    statusListeners_.erase(std::remove_if(statusListeners_.begin(), statusListeners_.end(), dead),
                           statusListeners_.end());
    needsCompaction_ = false;
}

std::size_t EventBus::listenerCount() const noexcept {
    auto live = [](const auto& data) { return data.id != 0; };
    return static_cast<std::size_t>(std::count_if(seriesListeners_.begin(), seriesListeners_.end(), live) +
                                    std::count_if(statusListeners_.begin(), statusListeners_.end(), live));
}

EventBus::Subscription EventBus::subscribeSeriesUpdated(SeriesUpdatedCallback callback) {
    const std::size_t id = nextId_++;
    seriesListeners_.push_back(CallbackData<SeriesUpdatedCallback>{id, std::move(callback)});
    return Subscription(this, Subscription::Kind::Series, id);
}

EventBus::Subscription EventBus::subscribeFeedStatus(FeedStatusCallback callback) {
    const std::size_t id = nextId_++;
    statusListeners_.push_back(CallbackData<FeedStatusCallback>{id, std::move(callback)});
    return Subscription(this, Subscription::Kind::Status, id);
}

void EventBus::unsubscribeSeries(std::size_t id) {
    erase(seriesListeners_, id);
}

void EventBus::unsubscribeStatus(std::size_t id) {
    erase(statusListeners_, id);
}

void EventBus::publishSeriesUpdated(const SeriesUpdated& event) {
    if (lastSeriesVersion_ && *lastSeriesVersion_ == event.version) {
        return;
    }
    lastSeriesVersion_ = event.version;
    dispatch(seriesListeners_, event);
}

void EventBus::publishFeedStatus(const FeedStatusChanged& event) {
    dispatch(statusListeners_, event);
}

}  // namespace core
