#pragma once

#include <chrono>
#include <optional>
#include <string_view>
#include "sale.hh"

namespace forsale {
// Parses the JSON object after the version tag against the closed set of keys {price, url, contact, expires}.
// Throws SchemaError with the reason of the first violation.
SalePayload validate(const CandidateRecord &candidate);

// Parses a YYYY-MM-DD calendar date.
std::optional<std::chrono::year_month_day> parse_date(std::string_view date);
}  // namespace forsale
