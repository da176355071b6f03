#include <chrono>
#include <memory>
#include "cache.hh"
#include "common.hh"

using namespace forsale;
using namespace std::chrono_literals;

int main() {
    auto now = std::make_shared<std::chrono::steady_clock::time_point>();
    SaleCache cache{30s, [now] { return *now; }};

    SaleOptions options{.cache_ttl = 60s};
    CacheKey key{"example.com", options};
    int computations = 0;
    auto compute = [&] {
        computations++;
        return SaleResponse{.domain = "example.com", .for_sale = true, .sources = {Source::Dns}};
    };

    auto first = cache.get_or_compute(key, compute);
    ASSERT(first.for_sale);
    ASSERT(cache.size() == 1);

    *now += 59s;
    auto second = cache.get_or_compute(key, compute);
    ASSERT(computations == 1);
    ASSERT(second == first);

    *now += 1s;
    ASSERT(!cache.find(key).has_value());
    ASSERT(cache.size() == 0);
    cache.get_or_compute(key, compute);
    ASSERT(computations == 2);

    // Options are a part of the key.
    CacheKey other_options{"example.com", SaleOptions{.enable_rdap_check = true, .cache_ttl = 60s}};
    cache.get_or_compute(other_options, compute);
    ASSERT(computations == 3);
    ASSERT(cache.size() == 2);

    // Zero TTL disables caching.
    CacheKey uncached{"example.com", SaleOptions{.cache_ttl = 0s}};
    cache.get_or_compute(uncached, compute);
    cache.get_or_compute(uncached, compute);
    ASSERT(computations == 5);
    return EXIT_SUCCESS;
}
