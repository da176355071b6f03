#include "common.hh"
#include "mock_config.hh"
#include "mock_records.hh"
#include "mock_resolver.hh"
#include "resolve.hh"

MockResponse mock_response = {
    .set_wrong_client_cookie = true,
    .answers = mock_a_rr(MOCK_DOMAIN, {1, 2, 3, 4}),
    .answers_count = 1,
};

int main() {
    Resolver resolver{MOCK_RESOLVER_CONFIG};
    ASSERT_THROWS(resolver.resolve(MOCK_DOMAIN, RRType::A), ResolveError,
                  ASSERT(e.kind() == ResolveErrorKind::ResolutionError));
    return EXIT_SUCCESS;
}
