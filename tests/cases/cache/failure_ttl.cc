#include <chrono>
#include <memory>
#include "cache.hh"
#include "common.hh"

using namespace forsale;
using namespace std::chrono_literals;

int main() {
    auto now = std::make_shared<std::chrono::steady_clock::time_point>();
    SaleCache cache{30s, [now] { return *now; }};

    CacheKey key{"example.com", SaleOptions{.cache_ttl = 3600s}};
    SaleResponse timed_out{.domain = "example.com", .errors = {{.kind = ErrorKind::Timeout}}};
    SaleResponse not_for_sale{.domain = "example.com"};
    SaleResponse nx_domain{.domain = "example.com", .errors = {{.kind = ErrorKind::NxDomain}}};
    SaleResponse bogus{.domain = "example.com", .errors = {{.kind = ErrorKind::DnssecValidationError}}};
    SaleResponse rdap_down{.domain = "example.com", .errors = {{.kind = ErrorKind::RdapUnreachable}}};

    ASSERT(cache.ttl_for(key, timed_out) == 30s);
    ASSERT(cache.ttl_for(key, bogus) == 30s);
    ASSERT(cache.ttl_for(key, rdap_down) == 30s);
    ASSERT(cache.ttl_for(key, not_for_sale) == 3600s);
    ASSERT(cache.ttl_for(key, nx_domain) == 3600s);

    CacheKey short_key{"example.com", SaleOptions{.cache_ttl = 10s}};
    ASSERT(cache.ttl_for(short_key, timed_out) == 10s);

    int computations = 0;
    cache.get_or_compute(key, [&] {
        computations++;
        return timed_out;
    });
    *now += 29s;
    ASSERT(cache.find(key).has_value());
    *now += 1s;
    ASSERT(!cache.find(key).has_value());
    return EXIT_SUCCESS;
}
