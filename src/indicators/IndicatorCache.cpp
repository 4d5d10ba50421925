#include "indicators/IndicatorCache.h"

#include "indicators/IndicatorEngine.h"
#include "logging/Log.h"

#include <utility>

namespace indicators {

std::shared_ptr<const IndicatorOutput> IndicatorCache::get(std::uint64_t version,
                                                           const std::vector<double>& closes,
                                                           const IndicatorSpec& spec) {
    if (version > newestVersion_) {
        evictOlderThan_(version);
        newestVersion_ = version;
    }

    auto it = cache_.find(spec);
    if (it != cache_.end() && it->second.version == version && it->second.output) {
        ++hits_;
        LOG_TRACE(logging::LogCategory::CACHE,
                  "%s hit at v%llu",
                  spec.label().c_str(),
                  static_cast<unsigned long long>(version));
        return it->second.output;
    }

    ++misses_;
    auto output = std::make_shared<const IndicatorOutput>(IndicatorEngine::compute(closes, spec));
    LOG_DEBUG(logging::LogCategory::CACHE,
              "%s computed at v%llu: %zu values",
              spec.label().c_str(),
              static_cast<unsigned long long>(version),
              output->length());
    cache_[spec] = CachedOutput{version, output};
    return output;
}

void IndicatorCache::invalidateAll() {
    cache_.clear();
    newestVersion_ = 0;
}

void IndicatorCache::evictOlderThan_(std::uint64_t version) {
    std::size_t evicted = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (it->second.version < version) {
            it = cache_.erase(it);
            ++evicted;
        }
        else {
            ++it;
        }
    }
    if (evicted > 0) {
        LOG_TRACE(logging::LogCategory::CACHE, "evicted %zu stale entries before v%llu", evicted,
                  static_cast<unsigned long long>(version));
    }
}

}  // namespace indicators
