#pragma once

#include "indicators/IndicatorTypes.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace indicators {

struct CachedOutput {
    std::uint64_t version{0};
    std::shared_ptr<const IndicatorOutput> output;
};

// Memoizes IndicatorEngine::compute() per (store version, spec). Entries belonging to an older
// version are dropped the first time a newer version is requested.
class IndicatorCache {
public:
    // Rethrows ConfigError / ComputeError from the engine; failures are not cached.
    std::shared_ptr<const IndicatorOutput> get(std::uint64_t version,
                                               const std::vector<double>& closes,
                                               const IndicatorSpec& spec);

    void invalidateAll();

    std::size_t size() const { return cache_.size(); }
    std::size_t hits() const { return hits_; }
    std::size_t misses() const { return misses_; }

private:
    void evictOlderThan_(std::uint64_t version);

    std::unordered_map<IndicatorSpec, CachedOutput, IndicatorSpecHash> cache_;
    std::uint64_t newestVersion_{0};
    std::size_t hits_{0};
    std::size_t misses_{0};
};

}  // namespace indicators
