#pragma once

#include <chrono>
#include <string>
#include <utility>
#include "resolve.hh"
#include "sale.hh"

namespace forsale {
// Looks up the `_for-sale` TXT RRset of a domain.
class RecordResolver {
public:
    virtual ~RecordResolver() = default;

    // Throws ResolveError. A returned answer may still be unauthenticated, callers must check it.
    virtual RawAnswer resolve(const std::string &domain, std::chrono::milliseconds timeout) = 0;
};

// Runs a fresh DNSSEC-validating Resolver for every lookup since the engine is not thread-safe.
class DnssecRecordResolver : public RecordResolver {
public:
    explicit DnssecRecordResolver(ResolverConfig config) : config(std::move(config)) {}

    RawAnswer resolve(const std::string &domain, std::chrono::milliseconds timeout) override;

private:
    ResolverConfig config;
};

// Concatenates the character-strings of a TXT RR.
std::string join_txt(const TXT &txt);
}  // namespace forsale
