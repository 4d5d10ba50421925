#include "app/LiveFeed.h"

#include <string>
#include <utility>

#include <boost/asio/error.hpp>

#include "core/EventBus.h"
#include "core/TimeSeriesStore.h"
#include "domain/Errors.h"
#include "logging/Log.h"

namespace app {

namespace {
constexpr std::chrono::seconds kFailureLogInterval{30};
}

LiveFeed::LiveFeed(boost::asio::io_context& ioc,
                   domain::MarketDataSource& source,
                   core::TimeSeriesStore& store,
                   core::EventBus& bus,
                   std::chrono::milliseconds pollInterval)
    : source_(source),
      store_(store),
      bus_(bus),
      timer_(ioc),
      interval_(pollInterval.count() > 0 ? pollInterval : std::chrono::milliseconds(1)),
      failureLog_(std::chrono::duration_cast<std::chrono::milliseconds>(kFailureLogInterval)) {}

LiveFeed::~LiveFeed() {
    stop();
}

void LiveFeed::start(const domain::SeriesKey& key) {
    if (running_) {
        setParams(key);
        return;
    }
    running_ = true;
    key_ = key;
    ++generation_;
    live_ = false;
    lastAppliedSequence_ = 0;
    LOG_INFO(logging::LogCategory::DATA,
             "LiveFeed started for %s, polling every %lld ms",
             key_.label().c_str(),
             static_cast<long long>(interval_.count()));
    fetchNow_();
    armTimer_(std::chrono::steady_clock::now() + interval_);
}

void LiveFeed::setParams(const domain::SeriesKey& key) {
    if (!running_) {
        start(key);
        return;
    }
    LOG_INFO(logging::LogCategory::DATA, "LiveFeed switching %s -> %s", key_.label().c_str(), key.label().c_str());

    key_ = key;
    ++generation_;
    lastAppliedSequence_ = 0;
    cancelInFlight_();
    ++timerEpoch_;
    timer_.cancel();
    failureLog_.reset();
    setLive_(false, false, "switched to " + key_.label());

    fetchNow_();
    armTimer_(std::chrono::steady_clock::now() + interval_);
}

void LiveFeed::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    ++timerEpoch_;
    timer_.cancel();
    cancelInFlight_();
    live_ = false;
    LOG_INFO(logging::LogCategory::DATA, "LiveFeed stopped for %s", key_.label().c_str());
}

void LiveFeed::fetchNow_() {
    const FetchTicket ticket{generation_, nextSequence_++};
    LOG_TRACE(logging::LogCategory::DATA,
              "fetch #%llu (gen %llu) for %s",
              static_cast<unsigned long long>(ticket.sequence),
              static_cast<unsigned long long>(ticket.generation),
              key_.label().c_str());

    // The slot exists before the call so a completion that runs synchronously can clear it.
    inFlight_[ticket.sequence] = nullptr;
    auto handle = source_.fetchSeries(key_, [this, ticket](domain::FetchResult result) {
        onFetchDone_(ticket, std::move(result));
    });
    auto it = inFlight_.find(ticket.sequence);
    if (it != inFlight_.end()) {
        it->second = std::move(handle);
    }
}

void LiveFeed::armTimer_(std::chrono::steady_clock::time_point deadline) {
    timer_.expires_at(deadline);
    const std::uint64_t epoch = timerEpoch_;
    timer_.async_wait([this, epoch](const boost::system::error_code& ec) { onTick_(ec, epoch); });
}

void LiveFeed::onTick_(boost::system::error_code ec, std::uint64_t timerEpoch) {
    if (ec == boost::asio::error::operation_aborted || timerEpoch != timerEpoch_ || !running_) {
        return;
    }
    if (ec) {
        LOG_WARN(logging::LogCategory::DATA, "poll timer error: %s", ec.message().c_str());
    }
    fetchNow_();
    // Fixed rate: the next deadline follows the previous one, not the fetch.
    armTimer_(timer_.expiry() + interval_);
}

void LiveFeed::onFetchDone_(FetchTicket ticket, domain::FetchResult result) {
    inFlight_.erase(ticket.sequence);
    if (!running_) {
        return;
    }
    if (ticket.generation != generation_) {
        LOG_DEBUG(logging::LogCategory::DATA,
                  "discarding fetch #%llu from generation %llu (current %llu)",
                  static_cast<unsigned long long>(ticket.sequence),
                  static_cast<unsigned long long>(ticket.generation),
                  static_cast<unsigned long long>(generation_));
        return;
    }
    if (ticket.sequence <= lastAppliedSequence_) {
        LOG_DEBUG(logging::LogCategory::DATA,
                  "discarding fetch #%llu, #%llu already applied",
                  static_cast<unsigned long long>(ticket.sequence),
                  static_cast<unsigned long long>(lastAppliedSequence_));
        return;
    }
    lastAppliedSequence_ = ticket.sequence;

    if (result.failed()) {
        markFailed_(result.error);
        return;
    }
    applySnapshot_(std::move(result.value));
}

void LiveFeed::applySnapshot_(domain::CandleBatch candles) {
    try {
        store_.replace(std::move(candles));
    }
    catch (const domain::DataError& ex) {
        markFailed_(std::string{"rejected snapshot: "} + ex.what());
        return;
    }

    const auto& current = store_.current();
    core::EventBus::SeriesUpdated event;
    event.key = key_;
    event.version = store_.version();
    event.count = current.size();
    event.firstTime = current.front().time;
    event.lastTime = current.back().time;
    bus_.publishSeriesUpdated(event);

    if (failureLog_.suppressed() > 0) {
        LOG_INFO(logging::LogCategory::DATA,
                 "%s recovered after %zu suppressed failures",
                 key_.label().c_str(),
                 failureLog_.suppressed());
    }
    failureLog_.reset();
    setLive_(true, false, "");
}

void LiveFeed::markFailed_(const std::string& reason) {
    if (failureLog_.allow()) {
        LOG_WARN(logging::LogCategory::DATA, "%s fetch failed: %s", key_.label().c_str(), reason.c_str());
    }
    live_ = false;
    core::EventBus::FeedStatusChanged event;
    event.key = key_;
    event.live = false;
    event.fetchFailed = true;
    event.message = reason;
    bus_.publishFeedStatus(event);
}

void LiveFeed::setLive_(bool live, bool fetchFailed, const std::string& message) {
    if (live_ == live && !fetchFailed) {
        return;
    }
    live_ = live;
    LOG_DEBUG(logging::LogCategory::DATA, "%s liveness -> %s", key_.label().c_str(), live ? "live" : "not live");
    core::EventBus::FeedStatusChanged event;
    event.key = key_;
    event.live = live;
    event.fetchFailed = fetchFailed;
    event.message = message;
    bus_.publishFeedStatus(event);
}

void LiveFeed::cancelInFlight_() {
    auto pending = std::move(inFlight_);
    inFlight_.clear();
    for (auto& entry : pending) {
        if (entry.second) {
            entry.second->cancel();
        }
    }
    if (!pending.empty()) {
        LOG_DEBUG(logging::LogCategory::DATA, "cancelled %zu in-flight fetch(es)", pending.size());
    }
}

}  // namespace app
