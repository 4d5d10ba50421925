#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace core {

class EventBus {
public:
    struct SeriesUpdated {
        domain::SeriesKey key{};
        std::uint64_t version{0};
        std::size_t count{0};
        domain::TimestampSec firstTime{0};
        domain::TimestampSec lastTime{0};
    };

    struct FeedStatusChanged {
        domain::SeriesKey key{};
        bool live{false};
        // Set when the change comes from a failed fetch rather than a parameter switch.
        bool fetchFailed{false};
        std::string message{};
    };

    using SeriesUpdatedCallback = std::function<void(const SeriesUpdated&)>;
    using FeedStatusCallback = std::function<void(const FeedStatusChanged&)>;

    class Subscription {
    public:
        enum class Kind { None, Series, Status };

        Subscription() = default;
        Subscription(EventBus* bus, Kind kind, std::size_t id);
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();
        bool active() const noexcept { return bus_ != nullptr && id_ != 0; }

    private:
        EventBus* bus_{nullptr};
        Kind kind_{Kind::None};
        std::size_t id_{0};
    };

    [[nodiscard]] Subscription subscribeSeriesUpdated(SeriesUpdatedCallback callback);
    [[nodiscard]] Subscription subscribeFeedStatus(FeedStatusCallback callback);
    void unsubscribeSeries(std::size_t id);
    void unsubscribeStatus(std::size_t id);

    void publishSeriesUpdated(const SeriesUpdated& event);
    void publishFeedStatus(const FeedStatusChanged& event);

    std::size_t listenerCount() const noexcept;

private:
    template <typename Callback>
    struct CallbackData {
        std::size_t id{};
        Callback callback{};
    };

    // Removal during a dispatch leaves a tombstone (id 0) that is compacted once the outermost dispatch returns.
    template <typename Callback, typename Event>
    void dispatch(std::vector<CallbackData<Callback>>& listeners, const Event& event);

    template <typename Callback>
    void erase(std::vector<CallbackData<Callback>>& listeners, std::size_t id);

    void compact();

    std::vector<CallbackData<SeriesUpdatedCallback>> seriesListeners_;
    std::vector<CallbackData<FeedStatusCallback>> statusListeners_;
    std::optional<std::uint64_t> lastSeriesVersion_;
    std::size_t nextId_{1};
    int dispatchDepth_{0};
    bool needsCompaction_{false};
};

}  // namespace core
