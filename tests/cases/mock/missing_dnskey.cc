#include "common.hh"
#include "mock_config.hh"
#include "mock_records.hh"
#include "mock_resolver.hh"
#include "resolve.hh"

// Authoritative empty answer to every query, including the DNSKEY query for the trust anchor.
MockResponse mock_response = {
    .is_authoritative = true,
};

int main() {
    Resolver resolver{MOCK_SIGNED_RESOLVER_CONFIG};
    ASSERT_THROWS(resolver.resolve(MOCK_DOMAIN, RRType::TXT), ResolveError,
                  ASSERT(e.kind() == ResolveErrorKind::DnssecValidationError));
    return EXIT_SUCCESS;
}
