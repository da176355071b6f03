#include "selector.hh"
#include <fmt/format.h>
#include <cstdint>
#include <string_view>
#include <vector>
#include "log.hh"

namespace forsale {
namespace {
std::vector<CandidateRecord> select_records(const RawAnswer &answer, std::vector<SaleError> *rejections) {
    std::vector<CandidateRecord> candidates;
    for (const auto &record : answer.records) {
        if (!record.content.starts_with(VERSION_TAG)) continue;

        if (record.content.length() > MAX_RECORD_SIZE) {
            log::debug("Discarding oversized record",
                       {log::field("size", static_cast<int64_t>(record.content.size()))});
            if (rejections != nullptr) {
                rejections->push_back({
                    .kind = ErrorKind::SchemaError,
                    .reason = SchemaReason::SizeExceeded,
                    .detail = fmt::format("Record is {} octets, at most {} are allowed", record.content.length(),
                                          MAX_RECORD_SIZE),
                });
            }
            continue;
        }

        candidates.push_back({
            .version_tag = VERSION_TAG,
            .content = record.content,
            .source_ttl = record.ttl,
        });
    }
    return candidates;
}
}  // namespace

std::vector<CandidateRecord> select(const RawAnswer &answer) { return select_records(answer, nullptr); }

std::vector<CandidateRecord> select(const RawAnswer &answer, std::vector<SaleError> &rejections) {
    return select_records(answer, &rejections);
}
}  // namespace forsale
