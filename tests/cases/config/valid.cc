#include <chrono>
#include <cstdlib>
#include "common.hh"
#include "config.hh"

using namespace forsale;
using namespace std::chrono_literals;

int main() {
    unsetenv("FORSALE_RDAP_BOOTSTRAP_URL");

    auto config = parse_config(R"(
log:
  level: debug
defaults:
  enable_rdap_check: true
  cache_ttl: 600
  timeout_ms: 2000
checker:
  rdap_only_confirms: false
  failure_ttl_cap: 10
  stage_grace_ms: 50
resolver:
  use_root_nameservers: false
  port: 5353
  recursion_desired: false
  cookies: require
  nameserver:
    address: 127.0.0.1
    zone: example.com
    ds:
      - key_tag: 370
        algorithm: 13
        digest_type: 2
        digest: BE74359954660069D5C63D200C39F5603827D7DD02B56F120EE9F3A86764247C
rdap:
  bootstrap_url: https://rdap.example.net/dns.json
  bootstrap_ttl: 60
  bootstrap_failure_ttl: 5
  max_response_size: 4096
  max_redirects: 1
)");

    ASSERT(config.logging.level == "debug");
    ASSERT(config.defaults.enable_rdap_check);
    ASSERT(config.defaults.cache_ttl == 600s);
    ASSERT(config.defaults.timeout == 2000ms);
    ASSERT(!config.checker.rdap_only_confirms);
    ASSERT(config.checker.failure_ttl_cap == 10s);
    ASSERT(config.checker.stage_grace == 50ms);

    ASSERT(!config.resolver.use_root_nameservers);
    ASSERT(config.resolver.port == 5353);
    ASSERT(!config.resolver.enable_rd);
    ASSERT(config.resolver.cookies == FeatureState::Require);
    ASSERT(config.resolver.nameserver.has_value());
    ASSERT(config.resolver.nameserver->address == "127.0.0.1");
    ASSERT(config.resolver.nameserver->zone_domain == "example.com");
    ASSERT(config.resolver.nameserver->dss.size() == 1);

    const auto &ds = config.resolver.nameserver->dss[0];
    ASSERT(ds.key_tag == 370);
    ASSERT(ds.signing_algorithm == SigningAlgorithm::ECDSAP256SHA256);
    ASSERT(ds.digest_algorithm == DigestAlgorithm::SHA256);
    ASSERT(ds.digest.size() == 32);
    ASSERT(ds.digest[0] == 0xBE && ds.digest[31] == 0x7C);

    ASSERT(config.rdap.bootstrap_url == "https://rdap.example.net/dns.json");
    ASSERT(config.rdap.bootstrap_ttl == 60s);
    ASSERT(config.rdap.bootstrap_failure_ttl == 5s);
    ASSERT(config.rdap.max_response_size == 4096);
    ASSERT(config.rdap.max_redirects == 1);

    auto resolver_config = to_resolver_config(config.resolver);
    ASSERT(!resolver_config.use_root_nameservers);
    ASSERT(resolver_config.port == 5353);
    ASSERT(resolver_config.nameserver->zone_domain == "example.com");

    // Everything is optional.
    auto defaults = parse_config("");
    ASSERT(defaults.defaults == SaleOptions{});
    ASSERT(defaults.resolver.use_root_nameservers);
    ASSERT(defaults.rdap.bootstrap_url == IANA_RDAP_BOOTSTRAP_URL);

    setenv("FORSALE_RDAP_BOOTSTRAP_URL", "https://mirror.example.org/dns.json", 1);
    ASSERT(parse_config("").rdap.bootstrap_url == "https://mirror.example.org/dns.json");
    return EXIT_SUCCESS;
}
