#pragma once

#include <stdexcept>
#include <string>

namespace domain {

// Malformed or empty candle snapshot; the store keeps its previous snapshot.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid indicator parameters; raised before any state is touched.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Failure inside an indicator strategy. Scoped to one indicator instance.
class ComputeError : public std::runtime_error {
public:
    explicit ComputeError(const std::string& message) : std::runtime_error(message) {}
};

// Transport or HTTP failure talking to the market-data service.
class FeedError : public std::runtime_error {
public:
    explicit FeedError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace domain
