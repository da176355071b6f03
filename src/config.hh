#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "checker.hh"
#include "dns.hh"
#include "log.hh"
#include "rdap.hh"
#include "resolve.hh"
#include "sale.hh"

namespace forsale {
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

struct ResolverSettings {
    bool use_root_nameservers{true};
    std::optional<NameserverConfig> nameserver{std::nullopt};
    uint16_t port{DNS_PORT};
    bool enable_rd{true};
    FeatureState cookies{FeatureState::Enable};
};

struct Config {
    log::LogConfig logging{};
    SaleOptions defaults{};
    CheckerConfig checker{};
    ResolverSettings resolver{};
    RdapConfig rdap{};
};

// Both throw ConfigError on unknown keys, wrongly typed or out of bounds values.
Config load_config(const std::string &path);
Config parse_config(const std::string &yaml);

// Applies FORSALE_RDAP_BOOTSTRAP_URL, throws ConfigError unless it is https. The logging variables are read by
// log::init.
void apply_environment(Config &config);

ResolverConfig to_resolver_config(const ResolverSettings &settings);

// Wires the DNSSEC-validating resolver and the libcurl RDAP checker.
std::unique_ptr<SaleStatusChecker> make_checker(const Config &config);
}  // namespace forsale
