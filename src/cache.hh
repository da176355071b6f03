#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "sale.hh"

namespace forsale {
struct CacheKey {
    std::string domain;
    bool enable_rdap_check;
    std::chrono::seconds cache_ttl;
    std::chrono::milliseconds timeout;

    CacheKey(std::string domain, const SaleOptions &options);

    bool operator==(const CacheKey &) const = default;
};

struct CacheKeyHash {
    size_t operator()(const CacheKey &key) const;
};

// Memoizes responses for their TTL and runs at most one computation per key at a time.
class SaleCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Compute = std::function<SaleResponse()>;

    explicit SaleCache(std::chrono::seconds failure_ttl_cap = std::chrono::seconds{30},
                       Clock clock = std::chrono::steady_clock::now);

    SaleCache(const SaleCache &) = delete;
    SaleCache &operator=(const SaleCache &) = delete;

    // Concurrent callers with the same key wait for the first one's computation. If it throws,
    // every waiter gets the exception and nothing is stored.
    SaleResponse get_or_compute(const CacheKey &key, const Compute &compute);

    std::optional<SaleResponse> find(const CacheKey &key);
    void invalidate(const CacheKey &key);
    void clear();
    // Number of entries which have not expired yet.
    size_t size() const;

    // Indeterminate results are kept for at most `failure_ttl_cap`.
    std::chrono::seconds ttl_for(const CacheKey &key, const SaleResponse &response) const;

private:
    struct Entry {
        SaleResponse value;
        std::chrono::steady_clock::time_point expires_at;
    };

    std::chrono::seconds failure_ttl_cap;
    Clock clock;

    mutable std::mutex mutex;
    std::unordered_map<CacheKey, Entry, CacheKeyHash> entries;
    std::unordered_map<CacheKey, std::shared_future<SaleResponse>, CacheKeyHash> in_flight;

    std::optional<SaleResponse> find_locked(const CacheKey &key, std::chrono::steady_clock::time_point now);
    void store_locked(const CacheKey &key, const SaleResponse &response, std::chrono::steady_clock::time_point now);
};
}  // namespace forsale
