#pragma once

#include <functional>
#include <memory>

#include "domain/DomainContracts.h"

namespace domain {

// Handle to one in-flight fetch. cancel() guarantees the completion callback is not invoked.
class FetchHandle {
public:
    virtual ~FetchHandle() = default;
    virtual void cancel() = 0;
};

class MarketDataSource {
public:
    using Completion = std::function<void(FetchResult)>;

    virtual ~MarketDataSource() = default;

    // Starts an asynchronous snapshot fetch. The completion runs on the caller's event loop.
    virtual std::unique_ptr<FetchHandle> fetchSeries(const SeriesKey& key, Completion onDone) = 0;
};

}  // namespace domain
