#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "domain/Types.h"

namespace core {

using CandleSnapshot = std::shared_ptr<const std::vector<domain::Candle>>;

// Holds the active candle history for one chart session. Every replace() is a full snapshot;
// a rejected snapshot leaves the previous one in place.
class TimeSeriesStore {
public:
    TimeSeriesStore();

    // Throws domain::DataError for empty input or non-increasing times.
    void replace(std::vector<domain::Candle> candles);

    const std::vector<domain::Candle>& current() const noexcept { return *ptr_; }
    CandleSnapshot snapshot() const noexcept { return ptr_; }

    // Bumped on every accepted replace(); 0 until the first snapshot lands.
    std::uint64_t version() const noexcept { return ver_; }
    bool empty() const noexcept { return ptr_->empty(); }
    std::size_t size() const noexcept { return ptr_->size(); }

    std::vector<double> closes() const;

    static void validate(const std::vector<domain::Candle>& candles);

private:
    CandleSnapshot ptr_;
    std::uint64_t ver_{0};
};

}  // namespace core
