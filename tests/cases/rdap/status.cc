#include <json/json.h>
#include <initializer_list>
#include "common.hh"
#include "rdap.hh"

using namespace forsale;

namespace {
Json::Value domain_with_status(std::initializer_list<const char *> statuses) {
    Json::Value domain{Json::objectValue};
    domain["objectClassName"] = "domain";
    domain["status"] = Json::Value{Json::arrayValue};
    for (const auto *status : statuses) domain["status"].append(status);
    return domain;
}
}  // namespace

int main() {
    ASSERT(has_for_sale_status(domain_with_status({"active", "for sale"})));
    ASSERT(has_for_sale_status(domain_with_status({"For-Sale"})));
    ASSERT(!has_for_sale_status(domain_with_status({"active", "client transfer prohibited"})));
    ASSERT(!has_for_sale_status(domain_with_status({"not for sale"})));
    ASSERT(!has_for_sale_status(domain_with_status({})));

    Json::Value without_status{Json::objectValue};
    ASSERT(!has_for_sale_status(without_status));

    Json::Value string_status{Json::objectValue};
    string_status["status"] = "for sale";
    ASSERT(!has_for_sale_status(string_status));

    // Only the top-level status of the domain object counts.
    Json::Value nested{Json::objectValue};
    nested["entities"] = Json::Value{Json::arrayValue};
    nested["entities"].append(domain_with_status({"for sale"}));
    ASSERT(!has_for_sale_status(nested));
    return EXIT_SUCCESS;
}
