#include <memory>
#include <string>
#include <vector>
#include "checker.hh"
#include "common.hh"
#include "stubs.hh"

using namespace forsale;

int main() {
    auto resolver = std::make_shared<StubRecordResolver>(signed_answer({R"(v=FORSALE1;{"price":"USD:1"})"}));
    SaleStatusChecker checker{resolver, nullptr};

    std::vector<std::string> domains{
        "",
        ".",
        "localhost",
        "exa mple.com",
        "-example.com",
        "example-.com",
        "example..com",
        "_for-sale.example.com",
        "ex\"ample.com",
        std::string(64, 'a') + ".com",
    };
    for (const auto &domain : domains) {
        auto response = checker.get_domain_sale_status(domain);
        ASSERT(response.domain == domain);
        ASSERT(!response.for_sale);
        ASSERT(response.errors.size() == 1);
        ASSERT(response.errors[0].kind == ErrorKind::InvalidDomain);
    }

    ASSERT(resolver->calls == 0);
    ASSERT(checker.cache().size() == 0);
    return EXIT_SUCCESS;
}
