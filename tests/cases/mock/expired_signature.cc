#include "common.hh"
#include "mock_config.hh"
#include "mock_records.hh"
#include "mock_resolver.hh"
#include "mock_signer.hh"
#include "resolve.hh"

#define RECORD_NAME "_for-sale." MOCK_DOMAIN

MockResponse mock_response = {
    .rcode = RCode::Refused,
};

int main() {
    MockZoneSigner signer{MOCK_DOMAIN};
    mock_zone[{MOCK_DOMAIN, RRType::DNSKEY}] = signer.dnskey_response();
    // Signed by the right key, but the signature lapsed an hour ago.
    mock_zone[{RECORD_NAME, RRType::TXT}] = MockResponse{
        .is_authoritative = true,
        .answers = signer.signed_rr(RECORD_NAME, RRType::TXT, mock_txt_rdata({R"(v=FORSALE1;{"price":"USD:1"})"}),
                                    SignatureValidity::expired()),
        .answers_count = 2,
    };

    Resolver resolver{signer.resolver_config()};
    ASSERT_THROWS(resolver.resolve(RECORD_NAME, RRType::TXT), ResolveError,
                  ASSERT(e.kind() == ResolveErrorKind::DnssecValidationError));
    return EXIT_SUCCESS;
}
