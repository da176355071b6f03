#include <memory>
#include "checker.hh"
#include "common.hh"
#include "stubs.hh"

using namespace forsale;

int main() {
    SaleOptions options{.enable_rdap_check = true};
    RdapResult tagged{.tag_present = true, .reachable = true};
    RdapResult untagged{.tag_present = false, .reachable = true};

    // DNS and RDAP agree.
    {
        auto resolver = std::make_shared<StubRecordResolver>(signed_answer({R"(v=FORSALE1;{"price":"USD:1"})"}));
        SaleStatusChecker checker{resolver, std::make_shared<StubRdapChecker>(tagged)};
        auto response = checker.get_domain_sale_status("example.com", options);
        ASSERT(response.for_sale);
        ASSERT((response.sources == std::vector<Source>{Source::Dns, Source::Rdap}));
        ASSERT(response.errors.empty());
    }

    // RDAP alone confirms by default.
    {
        auto resolver = std::make_shared<StubRecordResolver>(signed_answer({}));
        SaleStatusChecker checker{resolver, std::make_shared<StubRdapChecker>(tagged)};
        auto response = checker.get_domain_sale_status("example.com", options);
        ASSERT(response.for_sale);
        ASSERT(response.sources == std::vector<Source>{Source::Rdap});
        ASSERT(response.payload == SalePayload{});
    }

    // Unless configured to only corroborate DNS.
    {
        auto resolver = std::make_shared<StubRecordResolver>(signed_answer({}));
        SaleStatusChecker checker{resolver, std::make_shared<StubRdapChecker>(tagged),
                                  CheckerConfig{.rdap_only_confirms = false}};
        auto response = checker.get_domain_sale_status("example.com", options);
        ASSERT(!response.for_sale);
        ASSERT(response.sources.empty());
    }

    // RDAP without the tag does not override DNS.
    {
        auto resolver = std::make_shared<StubRecordResolver>(signed_answer({R"(v=FORSALE1;{"price":"USD:1"})"}));
        SaleStatusChecker checker{resolver, std::make_shared<StubRdapChecker>(untagged)};
        auto response = checker.get_domain_sale_status("example.com", options);
        ASSERT(response.for_sale);
        ASSERT(response.sources == std::vector<Source>{Source::Dns});
    }

    // An expired DNS offer stays withdrawn even when the registry still carries the tag.
    {
        auto resolver = std::make_shared<StubRecordResolver>(
            signed_answer({R"(v=FORSALE1;{"price":"USD:1","expires":"2001-01-01"})"}));
        SaleStatusChecker checker{resolver, std::make_shared<StubRdapChecker>(tagged)};
        auto response = checker.get_domain_sale_status("example.com", options);
        ASSERT(!response.for_sale);
        ASSERT(response.sources.empty());
        ASSERT(response.errors.size() == 1);
        ASSERT(response.errors[0].kind == ErrorKind::OfferExpired);
    }

    // RDAP is not consulted unless enabled.
    {
        auto resolver = std::make_shared<StubRecordResolver>(signed_answer({}));
        auto rdap_checker = std::make_shared<StubRdapChecker>(tagged);
        SaleStatusChecker checker{resolver, rdap_checker};
        auto response = checker.get_domain_sale_status("example.com");
        ASSERT(!response.for_sale);
        ASSERT(rdap_checker->calls == 0);
    }
    return EXIT_SUCCESS;
}
