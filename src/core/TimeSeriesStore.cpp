#include "core/TimeSeriesStore.h"

#include <cmath>
#include <string>
#include <utility>

#include "domain/Errors.h"
#include "logging/Log.h"

namespace {

bool finitePrices(const domain::Candle& c) {
    return std::isfinite(c.open) && std::isfinite(c.high) && std::isfinite(c.low) && std::isfinite(c.close) &&
           std::isfinite(c.volume);
}

}  // namespace

namespace core {

TimeSeriesStore::TimeSeriesStore()
    : ptr_(std::make_shared<const std::vector<domain::Candle>>()) {}

void TimeSeriesStore::validate(const std::vector<domain::Candle>& candles) {
    if (candles.empty()) {
        throw domain::DataError("empty candle snapshot");
    }
    for (std::size_t i = 0; i < candles.size(); ++i) {
        if (!finitePrices(candles[i])) {
            throw domain::DataError("non-finite value in candle at index " + std::to_string(i));
        }
        if (i > 0 && candles[i].time <= candles[i - 1].time) {
            throw domain::DataError("non-increasing candle time at index " + std::to_string(i) + " (" +
                                    std::to_string(candles[i - 1].time) + " -> " +
                                    std::to_string(candles[i].time) + ")");
        }
    }
}

void TimeSeriesStore::replace(std::vector<domain::Candle> candles) {
    try {
        validate(candles);
    }
    catch (const domain::DataError& ex) {
        LOG_WARN(logging::LogCategory::DATA,
                 "Snapshot rejected, keeping version=%llu (%zu candles): %s",
                 static_cast<unsigned long long>(ver_),
                 ptr_->size(),
                 ex.what());
        throw;
    }

    ptr_ = std::make_shared<const std::vector<domain::Candle>>(std::move(candles));
    ++ver_;
    LOG_TRACE(logging::LogCategory::DATA,
              "Snapshot version=%llu count=%zu first=%lld last=%lld",
              static_cast<unsigned long long>(ver_),
              ptr_->size(),
              static_cast<long long>(ptr_->front().time),
              static_cast<long long>(ptr_->back().time));
}

std::vector<double> TimeSeriesStore::closes() const {
    std::vector<double> out;
    out.reserve(ptr_->size());
    for (const auto& candle : *ptr_) {
        out.push_back(candle.close);
    }
    return out;
}

}  // namespace core
