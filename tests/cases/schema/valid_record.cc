#include <string>
#include "common.hh"
#include "schema.hh"

using namespace forsale;

namespace {
CandidateRecord candidate(const std::string &json) {
    return CandidateRecord{.version_tag = VERSION_TAG, .content = std::string{VERSION_TAG} + json, .source_ttl = 300};
}
}  // namespace

int main() {
    auto payload = validate(candidate(R"({"price":"USD:5000","url":"https://sale.example.com/buy",)"
                                      R"("contact":"mailto:owner@example.com","expires":"2099-12-31"})"));
    ASSERT(payload.price == "USD:5000");
    ASSERT(payload.url == "https://sale.example.com/buy");
    ASSERT(payload.contact == "mailto:owner@example.com");
    ASSERT(payload.expires == "2099-12-31");

    auto price_only = validate(candidate(R"({"price":"EUR:12.50"})"));
    ASSERT(price_only.price == "EUR:12.50");
    ASSERT(!price_only.url.has_value());

    auto with_query = validate(candidate(R"({"contact":"mailto:sales@example.org?subject=offer"})"));
    ASSERT(with_query.contact == "mailto:sales@example.org?subject=offer");
    return EXIT_SUCCESS;
}
