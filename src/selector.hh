#pragma once

#include <vector>
#include "sale.hh"

namespace forsale {
// Keeps the strings starting with the version tag that fit in MAX_RECORD_SIZE octets, in answer order.
std::vector<CandidateRecord> select(const RawAnswer &answer);
// Same as above, appends a SizeExceeded schema error for every version-tagged string that is too long.
std::vector<CandidateRecord> select(const RawAnswer &answer, std::vector<SaleError> &rejections);
}  // namespace forsale
