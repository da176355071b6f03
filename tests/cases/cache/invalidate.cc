#include "cache.hh"
#include "common.hh"

using namespace forsale;

int main() {
    SaleCache cache;
    CacheKey first{"first.com", SaleOptions{}};
    CacheKey second{"second.com", SaleOptions{}};

    int computations = 0;
    auto compute = [&] {
        computations++;
        return SaleResponse{.domain = "example.com"};
    };

    cache.get_or_compute(first, compute);
    cache.get_or_compute(second, compute);
    ASSERT(cache.size() == 2);

    cache.invalidate(first);
    ASSERT(cache.size() == 1);
    ASSERT(!cache.find(first).has_value());
    ASSERT(cache.find(second).has_value());

    cache.get_or_compute(first, compute);
    ASSERT(computations == 3);

    cache.clear();
    ASSERT(cache.size() == 0);
    return EXIT_SUCCESS;
}
