#include "record_resolver.hh"
#include <fmt/format.h>
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <variant>
#include "dns.hh"
#include "domain.hh"
#include "log.hh"
#include "resolve.hh"

namespace forsale {
std::string join_txt(const TXT &txt) {
    std::string joined;
    for (const auto &string : txt.strings) joined += string;
    return joined;
}

RawAnswer DnssecRecordResolver::resolve(const std::string &domain, std::chrono::milliseconds timeout) {
    auto resolver_config = config;
    resolver_config.timeout = timeout;

    std::unique_ptr<Resolver> resolver;
    try {
        resolver = std::make_unique<Resolver>(resolver_config);
    } catch (const std::exception &e) {
        throw ResolveError(ResolveErrorKind::ResolutionError,
                           fmt::format("Failed to start the resolver: {}", e.what()));
    }

    auto qname = std::string{FOR_SALE_LABEL} + domain;
    log::debug("Querying TXT", {log::field("qname", qname), log::field("timeout_ms", timeout.count())});

    // Resolver only returns authenticated answers, failures come back as ResolveError.
    auto rrset = resolver->resolve(qname, RRType::TXT);

    RawAnswer answer{.records = {}, .dnssec_authenticated = true, .rcode = RCode::Success};
    for (const auto &rr : rrset) {
        if (const auto *txt = std::get_if<TXT>(&rr.data)) answer.records.push_back({join_txt(*txt), rr.ttl});
    }
    return answer;
}
}  // namespace forsale
