#pragma once

#include <string>
#include <string_view>

#include "domain/DomainContracts.h"

namespace infra::feed {

// Parses the body of a series response into candles. Rows are kept in response order; ordering is
// validated later by the store. Throws domain::FeedError on malformed payloads.
domain::CandleBatch parse_series_json(std::string_view body);

// "2024-03-15" -> 1710460800. Returns false for anything that is not a valid calendar date.
bool parse_business_day(std::string_view text, domain::TimestampSec& out);

}  // namespace infra::feed
