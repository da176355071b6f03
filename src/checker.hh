#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "cache.hh"
#include "rdap.hh"
#include "record_resolver.hh"
#include "sale.hh"

namespace forsale {
struct CheckerConfig {
    // Whether the RDAP tag alone marks a domain for sale when DNS has no valid record.
    bool rdap_only_confirms{true};
    std::chrono::seconds failure_ttl_cap{30};
    // Added to the timeout when waiting for a stage, a stage which is still running after it yields Timeout.
    std::chrono::milliseconds stage_grace{250};
    SaleOptions default_options{};
};

class SaleStatusChecker {
public:
    SaleStatusChecker(std::shared_ptr<RecordResolver> resolver, std::shared_ptr<RdapChecker> rdap_checker,
                      CheckerConfig config = {}, SaleCache::Clock clock = std::chrono::steady_clock::now);

    SaleStatusChecker(const SaleStatusChecker &) = delete;
    SaleStatusChecker &operator=(const SaleStatusChecker &) = delete;

    // Never throws for untrusted input, failures are reported in `errors`.
    // Throws std::invalid_argument if `options` are out of bounds.
    SaleResponse get_domain_sale_status(const std::string &domain, const SaleOptions &options);
    SaleResponse get_domain_sale_status(const std::string &domain);

    SaleCache &cache() { return sale_cache; }

private:
    struct DnsOutcome {
        std::optional<SalePayload> payload;
        std::vector<SaleError> errors;
    };

    std::shared_ptr<RecordResolver> resolver;
    std::shared_ptr<RdapChecker> rdap_checker;
    CheckerConfig config;
    SaleCache sale_cache;

    SaleResponse check(const std::string &domain, const SaleOptions &options);

    static DnsOutcome run_dns_stage(RecordResolver &resolver, const std::string &domain,
                                    std::chrono::milliseconds timeout);
};
}  // namespace forsale
