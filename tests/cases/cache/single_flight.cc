#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "cache.hh"
#include "common.hh"

using namespace forsale;
using namespace std::chrono_literals;

int main() {
    SaleCache cache;
    CacheKey key{"example.com", SaleOptions{}};

    std::atomic<int> computations{0};
    auto compute = [&] {
        computations++;
        std::this_thread::sleep_for(200ms);
        return SaleResponse{.domain = "example.com", .for_sale = true, .sources = {Source::Dns}};
    };

    std::vector<SaleResponse> responses(8);
    std::vector<std::thread> threads;
    for (auto &response : responses) {
        threads.emplace_back([&] { response = cache.get_or_compute(key, compute); });
    }
    for (auto &thread : threads) thread.join();

    ASSERT(computations == 1);
    for (const auto &response : responses) ASSERT(response == responses[0] && response.for_sale);
    return EXIT_SUCCESS;
}
