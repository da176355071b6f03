#include "checker.hh"
#include <fmt/format.h>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "domain.hh"
#include "log.hh"
#include "resolve.hh"
#include "schema.hh"
#include "selector.hh"

namespace forsale {
namespace {
ErrorKind to_error_kind(ResolveErrorKind kind) {
    switch (kind) {
        case ResolveErrorKind::Timeout:               return ErrorKind::Timeout;
        case ResolveErrorKind::NxDomain:              return ErrorKind::NxDomain;
        case ResolveErrorKind::DnssecValidationError: return ErrorKind::DnssecValidationError;
        case ResolveErrorKind::ResolutionError:       return ErrorKind::ResolutionError;
    }
    return ErrorKind::ResolutionError;
}

// Runs `stage` on a detached thread so that a stage stuck in I/O cannot hold the caller past the deadline.
// The thread owns everything it touches, its result is dropped if nobody waits for it anymore.
template <typename T, typename Stage>
std::future<T> start_stage(Stage stage) {
    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();
    std::thread([promise, stage = std::move(stage)]() mutable {
        try {
            promise->set_value(stage());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();
    return future;
}

bool is_expired(const std::string &expires) {
    auto date = parse_date(expires);
    if (!date.has_value()) return false;

    auto today = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
    return std::chrono::sys_days{*date} < today;
}
}  // namespace

SaleStatusChecker::SaleStatusChecker(std::shared_ptr<RecordResolver> resolver,
                                     std::shared_ptr<RdapChecker> rdap_checker, CheckerConfig config,
                                     SaleCache::Clock clock)
    : resolver(std::move(resolver)),
      rdap_checker(std::move(rdap_checker)),
      config(std::move(config)),
      sale_cache(this->config.failure_ttl_cap, std::move(clock)) {
    if (this->resolver == nullptr) throw std::invalid_argument("Record resolver is required");
    validate_options(this->config.default_options);
}

SaleResponse SaleStatusChecker::get_domain_sale_status(const std::string &domain) {
    return get_domain_sale_status(domain, config.default_options);
}

SaleResponse SaleStatusChecker::get_domain_sale_status(const std::string &domain, const SaleOptions &options) {
    validate_options(options);

    auto normalized = normalize_domain(domain);
    if (!normalized.has_value()) {
        log::info("Rejected domain", {log::field("domain", domain)});
        return SaleResponse{
            .domain = domain,
            .for_sale = false,
            .errors = {{.kind = ErrorKind::InvalidDomain, .detail = "Domain is not a valid host name"}},
        };
    }

    return sale_cache.get_or_compute(CacheKey{*normalized, options}, [&] { return check(*normalized, options); });
}

SaleStatusChecker::DnsOutcome SaleStatusChecker::run_dns_stage(RecordResolver &resolver, const std::string &domain,
                                                               std::chrono::milliseconds timeout) {
    DnsOutcome outcome;

    RawAnswer answer;
    try {
        answer = resolver.resolve(domain, timeout);
    } catch (const ResolveError &e) {
        outcome.errors.push_back({.kind = to_error_kind(e.kind()), .detail = e.what()});
        return outcome;
    } catch (const std::exception &e) {
        outcome.errors.push_back({.kind = ErrorKind::ResolutionError, .detail = e.what()});
        return outcome;
    }

    if (answer.rcode == RCode::NameError) {
        outcome.errors.push_back({.kind = ErrorKind::NxDomain, .detail = "Record does not exist"});
        return outcome;
    }
    if (answer.rcode != RCode::Success) {
        outcome.errors.push_back({
            .kind = ErrorKind::ResolutionError,
            .detail = fmt::format("Lookup failed with rcode {}", std::to_underlying(answer.rcode)),
        });
        return outcome;
    }
    if (!answer.dnssec_authenticated) {
        outcome.errors.push_back({.kind = ErrorKind::DnssecValidationError, .detail = "Answer is not authenticated"});
        return outcome;
    }

    for (const auto &candidate : select(answer, outcome.errors)) {
        try {
            outcome.payload = validate(candidate);
            break;
        } catch (const SchemaError &e) {
            log::info("Rejected record", {log::field("domain", domain),
                                          log::field("reason", schema_reason_to_string(e.reason())),
                                          log::field("detail", e.what())});
            outcome.errors.push_back({.kind = ErrorKind::SchemaError, .reason = e.reason(), .detail = e.what()});
        }
    }
    return outcome;
}

SaleResponse SaleStatusChecker::check(const std::string &domain, const SaleOptions &options) {
    auto deadline = std::chrono::steady_clock::now() + options.timeout + config.stage_grace;

    std::optional<std::future<RdapResult>> rdap_future;
    if (options.enable_rdap_check && rdap_checker != nullptr) {
        rdap_future = start_stage<RdapResult>(
            [rdap_checker = rdap_checker, domain, timeout = options.timeout] {
                return rdap_checker->cross_check(domain, timeout);
            });
    }
    auto dns_future = start_stage<DnsOutcome>([resolver = resolver, domain, timeout = options.timeout] {
        return run_dns_stage(*resolver, domain, timeout);
    });

    SaleResponse response{.domain = domain};

    DnsOutcome dns;
    if (dns_future.wait_until(deadline) == std::future_status::ready) {
        dns = dns_future.get();
    } else {
        dns.errors.push_back({.kind = ErrorKind::Timeout, .detail = "DNS lookup did not finish in time"});
    }
    for (const auto &error : dns.errors) {
        log::info("DNS stage error", {log::field("domain", domain),
                                      log::field("kind", error_kind_to_string(error.kind)),
                                      log::field("detail", error.detail)});
    }
    response.errors = std::move(dns.errors);

    bool dns_confirmed = dns.payload.has_value();
    // The owner withdrew the offer, a registry tag left behind cannot revive it.
    bool offer_expired = false;
    if (dns_confirmed && dns.payload->expires.has_value() && is_expired(*dns.payload->expires)) {
        response.errors.push_back({.kind = ErrorKind::OfferExpired, .detail = *dns.payload->expires});
        dns_confirmed = false;
        offer_expired = true;
    }
    if (dns_confirmed) {
        response.for_sale = true;
        response.payload = std::move(*dns.payload);
        response.sources.push_back(Source::Dns);
    }

    if (options.enable_rdap_check) {
        RdapResult rdap;
        if (rdap_future.has_value()) {
            if (rdap_future->wait_until(deadline) == std::future_status::ready) {
                rdap = rdap_future->get();
            } else {
                rdap.timed_out = true;
            }
        }

        if (rdap.timed_out) {
            response.errors.push_back({.kind = ErrorKind::Timeout, .detail = "RDAP lookup did not finish in time"});
        } else if (!rdap.reachable) {
            response.errors.push_back({.kind = ErrorKind::RdapUnreachable, .detail = "RDAP server is unreachable"});
        } else if (rdap.tag_present && (dns_confirmed || (config.rdap_only_confirms && !offer_expired))) {
            response.for_sale = true;
            response.sources.push_back(Source::Rdap);
        }
    }

    log::debug("Lookup finished", {log::field("domain", domain), log::bool_field("for_sale", response.for_sale),
                                   log::field("errors", static_cast<int64_t>(response.errors.size()))});
    return response;
}
}  // namespace forsale
