#include <cstdlib>
#include <string>
#include "common.hh"
#include "config.hh"
#include "rdap.hh"

using namespace forsale;

namespace {
void expect_invalid(const std::string &yaml) { ASSERT_THROWS(parse_config(yaml), ConfigError, ); }
}  // namespace

int main() {
    expect_invalid("cache: {}");
    expect_invalid("defaults: {timeout: 100}");
    expect_invalid("defaults: []");
    expect_invalid("defaults: {timeout_ms: fast}");
    expect_invalid("defaults: {timeout_ms: 0}");
    expect_invalid("defaults: {timeout_ms: 60001}");
    expect_invalid("defaults: {cache_ttl: -5}");
    expect_invalid("defaults: {enable_rdap_check: [true]}");
    expect_invalid("log: {level: loud}");
    expect_invalid("checker: {stage_grace_ms: -1}");
    expect_invalid("resolver: {use_root_nameservers: false}");
    expect_invalid("resolver: {cookies: sometimes}");
    expect_invalid("resolver: {port: 70000}");
    expect_invalid("resolver: {nameserver: {zone: example.com}}");
    expect_invalid("resolver: {nameserver: {address: 127.0.0.1, ds: [{key_tag: 1, algorithm: 13, digest_type: 2, "
                   "digest: AB}]}}");
    expect_invalid("resolver: {nameserver: {address: 127.0.0.1, zone: example.com, ds: [{key_tag: 1, algorithm: 99, "
                   "digest_type: 2, digest: AB}]}}");
    expect_invalid("resolver: {nameserver: {address: 127.0.0.1, zone: example.com, ds: [{key_tag: 1, algorithm: 13, "
                   "digest_type: 2, digest: XYZ}]}}");
    expect_invalid("rdap: {bootstrap_url: http://data.iana.org/rdap/dns.json}");
    expect_invalid("rdap: {max_redirects: -1}");
    expect_invalid("defaults: {timeout_ms: 100");

    ASSERT_THROWS(load_config("/nonexistent/forsale.yaml"), ConfigError, );

    // The environment override is held to the same rule as the file.
    setenv("FORSALE_RDAP_BOOTSTRAP_URL", "http://mirror.example.org/dns.json", 1);
    expect_invalid("");
    expect_invalid("rdap: {bootstrap_url: https://data.iana.org/rdap/dns.json}");
    unsetenv("FORSALE_RDAP_BOOTSTRAP_URL");
    ASSERT(parse_config("").rdap.bootstrap_url == IANA_RDAP_BOOTSTRAP_URL);
    return EXIT_SUCCESS;
}
