#include "cache.hh"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include "log.hh"

namespace forsale {
namespace {
// Expired entries are only purged once the map grows past this size.
const constexpr size_t PURGE_THRESHOLD = 1024;

const ErrorKind INDETERMINATE_ERRORS[] = {
    ErrorKind::Timeout,
    ErrorKind::ResolutionError,
    ErrorKind::DnssecValidationError,
    ErrorKind::RdapUnreachable,
};

void hash_combine(size_t &seed, size_t value) { seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2); }
}  // namespace

CacheKey::CacheKey(std::string domain, const SaleOptions &options)
    : domain(std::move(domain)),
      enable_rdap_check(options.enable_rdap_check),
      cache_ttl(options.cache_ttl),
      timeout(options.timeout) {}

size_t CacheKeyHash::operator()(const CacheKey &key) const {
    size_t seed = std::hash<std::string>{}(key.domain);
    hash_combine(seed, std::hash<bool>{}(key.enable_rdap_check));
    hash_combine(seed, std::hash<int64_t>{}(key.cache_ttl.count()));
    hash_combine(seed, std::hash<int64_t>{}(key.timeout.count()));
    return seed;
}

SaleCache::SaleCache(std::chrono::seconds failure_ttl_cap, Clock clock)
    : failure_ttl_cap(failure_ttl_cap), clock(std::move(clock)) {}

SaleResponse SaleCache::get_or_compute(const CacheKey &key, const Compute &compute) {
    std::unique_lock lock{mutex};
    if (auto cached = find_locked(key, clock()); cached.has_value()) {
        log::debug("Cache hit", {log::field("domain", key.domain)});
        return std::move(*cached);
    }

    if (auto it = in_flight.find(key); it != in_flight.end()) {
        auto future = it->second;
        lock.unlock();
        log::debug("Waiting for an in-flight lookup", {log::field("domain", key.domain)});
        return future.get();
    }

    log::debug("Cache miss", {log::field("domain", key.domain)});
    std::promise<SaleResponse> promise;
    in_flight.emplace(key, promise.get_future().share());
    lock.unlock();

    try {
        auto response = compute();

        lock.lock();
        store_locked(key, response, clock());
        in_flight.erase(key);
        lock.unlock();

        promise.set_value(response);
        return response;
    } catch (...) {
        if (!lock.owns_lock()) lock.lock();
        in_flight.erase(key);
        lock.unlock();

        promise.set_exception(std::current_exception());
        throw;
    }
}

std::optional<SaleResponse> SaleCache::find(const CacheKey &key) {
    std::lock_guard lock{mutex};
    return find_locked(key, clock());
}

void SaleCache::invalidate(const CacheKey &key) {
    std::lock_guard lock{mutex};
    entries.erase(key);
}

void SaleCache::clear() {
    std::lock_guard lock{mutex};
    entries.clear();
}

size_t SaleCache::size() const {
    std::lock_guard lock{mutex};
    auto now = clock();
    return static_cast<size_t>(
        std::ranges::count_if(entries, [now](const auto &entry) { return now < entry.second.expires_at; }));
}

std::chrono::seconds SaleCache::ttl_for(const CacheKey &key, const SaleResponse &response) const {
    auto is_indeterminate
        = std::ranges::any_of(INDETERMINATE_ERRORS, [&](ErrorKind kind) { return response.has_error(kind); });
    return is_indeterminate ? std::min(key.cache_ttl, failure_ttl_cap) : key.cache_ttl;
}

std::optional<SaleResponse> SaleCache::find_locked(const CacheKey &key, std::chrono::steady_clock::time_point now) {
    auto it = entries.find(key);
    if (it == entries.end()) return std::nullopt;

    if (now >= it->second.expires_at) {
        entries.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void SaleCache::store_locked(const CacheKey &key, const SaleResponse &response,
                             std::chrono::steady_clock::time_point now) {
    auto ttl = ttl_for(key, response);
    if (ttl <= std::chrono::seconds::zero()) return;

    if (entries.size() >= PURGE_THRESHOLD) {
        std::erase_if(entries, [now](const auto &entry) { return now >= entry.second.expires_at; });
    }
    entries.insert_or_assign(key, Entry{.value = response, .expires_at = now + ttl});
}
}  // namespace forsale
