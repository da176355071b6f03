#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include "cache.hh"
#include "common.hh"

using namespace forsale;
using namespace std::chrono_literals;

int main() {
    SaleCache cache;
    CacheKey key{"example.com", SaleOptions{}};

    std::atomic<bool> waiter_failed{false};
    std::thread first([&] {
        try {
            cache.get_or_compute(key, []() -> SaleResponse {
                std::this_thread::sleep_for(500ms);
                throw std::runtime_error("lookup failed");
            });
        } catch (const std::runtime_error &) {
        }
    });
    std::this_thread::sleep_for(50ms);
    std::thread second([&] {
        try {
            cache.get_or_compute(key, [] { return SaleResponse{.domain = "example.com"}; });
        } catch (const std::runtime_error &e) {
            waiter_failed = std::string{e.what()} == "lookup failed";
        }
    });
    first.join();
    second.join();

    ASSERT(waiter_failed);
    ASSERT(!cache.find(key).has_value());

    // Nothing was stored, the next caller computes again.
    auto response = cache.get_or_compute(key, [] { return SaleResponse{.domain = "example.com"}; });
    ASSERT(response.domain == "example.com");
    ASSERT(cache.size() == 1);
    return EXIT_SUCCESS;
}
