#include <chrono>
#include <memory>
#include "checker.hh"
#include "common.hh"
#include "stubs.hh"

using namespace forsale;
using namespace std::chrono_literals;

int main() {
    auto resolver = std::make_shared<StubRecordResolver>(signed_answer({R"(v=FORSALE1;{"price":"USD:1"})"}), 3s);
    auto rdap_checker = std::make_shared<StubRdapChecker>(RdapResult{.tag_present = true, .reachable = true}, 3s);
    SaleStatusChecker checker{resolver, rdap_checker, CheckerConfig{.stage_grace = 100ms}};

    SaleOptions options{.enable_rdap_check = true, .timeout = 200ms};
    auto start = std::chrono::steady_clock::now();
    auto response = checker.get_domain_sale_status("example.com", options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT(elapsed < 1s);
    ASSERT(!response.for_sale);
    ASSERT(response.errors.size() == 2);
    ASSERT(response.errors[0].kind == ErrorKind::Timeout);
    ASSERT(response.errors[1].kind == ErrorKind::Timeout);

    // Timeouts are cached for a short time only.
    CacheKey key{"example.com", options};
    ASSERT(checker.cache().ttl_for(key, response) == std::chrono::seconds{30});
    return EXIT_SUCCESS;
}
