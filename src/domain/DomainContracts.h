#pragma once

#include "domain/Types.h"

#include <string>
#include <utility>

namespace domain {

template <typename T>
struct Result {
    T value{};
    bool ok{true};
    std::string error{};

    bool failed() const { return !ok; }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(std::string message) {
        Result r;
        r.ok = false;
        r.error = std::move(message);
        return r;
    }
};

using CandleBatch = std::vector<Candle>;
using FetchResult = Result<CandleBatch>;

}  // namespace domain
