#include "config.hh"
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "encode.hh"

namespace forsale {
namespace {
const std::string_view LOG_LEVELS[] = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};

void check_map(const YAML::Node &node, const std::string &path, std::initializer_list<std::string_view> keys) {
    if (!node.IsMap()) throw ConfigError(fmt::format("{} must be a mapping", path));

    for (const auto &entry : node) {
        auto key = entry.first.as<std::string>();
        if (std::ranges::find(keys, key) == keys.end()) {
            throw ConfigError(fmt::format("Unknown key \"{}\" in {}", key, path));
        }
    }
}

template <typename T>
T read(const YAML::Node &node, const std::string &path) {
    if (!node.IsScalar()) throw ConfigError(fmt::format("{} must be a scalar", path));
    try {
        return node.as<T>();
    } catch (const YAML::Exception &e) {
        throw ConfigError(fmt::format("{} has an invalid value \"{}\": {}", path, node.Scalar(), e.msg));
    }
}

template <typename T>
void read_into(const YAML::Node &parent, const char *key, const std::string &path, T &out) {
    if (auto node = parent[key]) out = read<T>(node, fmt::format("{}.{}", path, key));
}

template <typename Duration>
void read_duration(const YAML::Node &parent, const char *key, const std::string &path, Duration &out) {
    if (auto node = parent[key]) {
        auto value = read<int64_t>(node, fmt::format("{}.{}", path, key));
        if (value < 0) throw ConfigError(fmt::format("{}.{} must not be negative", path, key));
        out = Duration{value};
    }
}

FeatureState parse_feature_state(const std::string &value, const std::string &path) {
    if (value == "disable") return FeatureState::Disable;
    if (value == "enable") return FeatureState::Enable;
    if (value == "require") return FeatureState::Require;
    throw ConfigError(fmt::format("{} must be one of disable, enable, require", path));
}

SigningAlgorithm parse_signing_algorithm(unsigned value, const std::string &path) {
    switch (static_cast<SigningAlgorithm>(value)) {
        case SigningAlgorithm::RSASHA1:
        case SigningAlgorithm::RSASHA256:
        case SigningAlgorithm::RSASHA512:
        case SigningAlgorithm::ECDSAP256SHA256:
        case SigningAlgorithm::ECDSAP384SHA384:
        case SigningAlgorithm::ED25519:
        case SigningAlgorithm::ED448:           return static_cast<SigningAlgorithm>(value);
    }
    throw ConfigError(fmt::format("{} is not a supported signing algorithm", path));
}

DigestAlgorithm parse_digest_algorithm(unsigned value, const std::string &path) {
    switch (static_cast<DigestAlgorithm>(value)) {
        case DigestAlgorithm::SHA1:
        case DigestAlgorithm::SHA256:
        case DigestAlgorithm::SHA384: return static_cast<DigestAlgorithm>(value);
    }
    throw ConfigError(fmt::format("{} is not a supported digest algorithm", path));
}

DS parse_ds(const YAML::Node &node, const std::string &path) {
    check_map(node, path, {"key_tag", "algorithm", "digest_type", "digest"});
    for (const auto *key : {"key_tag", "algorithm", "digest_type", "digest"}) {
        if (!node[key]) throw ConfigError(fmt::format("{}.{} is required", path, key));
    }

    auto algorithm = read<unsigned>(node["algorithm"], path + ".algorithm");
    auto digest_type = read<unsigned>(node["digest_type"], path + ".digest_type");
    auto digest = hex_decode(read<std::string>(node["digest"], path + ".digest"));
    if (!digest.has_value() || digest->empty()) throw ConfigError(fmt::format("{}.digest must be hex", path));

    return DS{
        .key_tag = read<uint16_t>(node["key_tag"], path + ".key_tag"),
        .signing_algorithm = parse_signing_algorithm(algorithm, path + ".algorithm"),
        .digest_algorithm = parse_digest_algorithm(digest_type, path + ".digest_type"),
        .digest = std::move(*digest),
        .data = {},
    };
}

NameserverConfig parse_nameserver(const YAML::Node &node, const std::string &path) {
    check_map(node, path, {"address", "zone", "ds"});
    if (!node["address"]) throw ConfigError(fmt::format("{}.address is required", path));

    NameserverConfig nameserver{.address = read<std::string>(node["address"], path + ".address")};
    if (auto zone = node["zone"]) nameserver.zone_domain = read<std::string>(zone, path + ".zone");
    if (auto dss = node["ds"]) {
        if (!dss.IsSequence()) throw ConfigError(fmt::format("{}.ds must be a sequence", path));
        for (size_t i = 0; i < dss.size(); i++) {
            nameserver.dss.push_back(parse_ds(dss[i], fmt::format("{}.ds[{}]", path, i)));
        }
    }
    if (!nameserver.dss.empty() && !nameserver.zone_domain.has_value()) {
        throw ConfigError(fmt::format("{}.zone is required with a trust anchor", path));
    }
    return nameserver;
}

void parse_log(const YAML::Node &node, log::LogConfig &config) {
    check_map(node, "log", {"level", "pattern"});
    read_into(node, "level", "log", config.level);
    read_into(node, "pattern", "log", config.pattern);
    if (std::ranges::find(LOG_LEVELS, config.level) == std::end(LOG_LEVELS)) {
        throw ConfigError(fmt::format("log.level \"{}\" is not a log level", config.level));
    }
}

void parse_defaults(const YAML::Node &node, SaleOptions &options) {
    check_map(node, "defaults", {"enable_rdap_check", "cache_ttl", "timeout_ms"});
    read_into(node, "enable_rdap_check", "defaults", options.enable_rdap_check);
    read_duration(node, "cache_ttl", "defaults", options.cache_ttl);
    read_duration(node, "timeout_ms", "defaults", options.timeout);

    try {
        validate_options(options);
    } catch (const std::invalid_argument &e) {
        throw ConfigError(fmt::format("defaults: {}", e.what()));
    }
}

void parse_checker(const YAML::Node &node, CheckerConfig &config) {
    check_map(node, "checker", {"rdap_only_confirms", "failure_ttl_cap", "stage_grace_ms"});
    read_into(node, "rdap_only_confirms", "checker", config.rdap_only_confirms);
    read_duration(node, "failure_ttl_cap", "checker", config.failure_ttl_cap);
    read_duration(node, "stage_grace_ms", "checker", config.stage_grace);
}

void parse_resolver(const YAML::Node &node, ResolverSettings &settings) {
    check_map(node, "resolver", {"use_root_nameservers", "nameserver", "port", "recursion_desired", "cookies"});
    read_into(node, "use_root_nameservers", "resolver", settings.use_root_nameservers);
    read_into(node, "port", "resolver", settings.port);
    read_into(node, "recursion_desired", "resolver", settings.enable_rd);
    if (auto cookies = node["cookies"]) {
        settings.cookies = parse_feature_state(read<std::string>(cookies, "resolver.cookies"), "resolver.cookies");
    }
    if (auto nameserver = node["nameserver"]) settings.nameserver = parse_nameserver(nameserver, "resolver.nameserver");

    if (!settings.use_root_nameservers && !settings.nameserver.has_value()) {
        throw ConfigError("resolver.nameserver is required without the root nameservers");
    }
}

void parse_rdap(const YAML::Node &node, RdapConfig &config) {
    check_map(node, "rdap",
              {"bootstrap_url", "bootstrap_ttl", "bootstrap_failure_ttl", "max_response_size", "max_redirects"});
    read_into(node, "bootstrap_url", "rdap", config.bootstrap_url);
    read_duration(node, "bootstrap_ttl", "rdap", config.bootstrap_ttl);
    read_duration(node, "bootstrap_failure_ttl", "rdap", config.bootstrap_failure_ttl);
    read_into(node, "max_response_size", "rdap", config.max_response_size);
    read_into(node, "max_redirects", "rdap", config.max_redirects);

    if (!config.bootstrap_url.starts_with("https://")) throw ConfigError("rdap.bootstrap_url must be an https URL");
    if (config.max_redirects < 0) throw ConfigError("rdap.max_redirects must not be negative");
}

Config from_yaml(const YAML::Node &root) {
    Config config;
    if (root.IsNull()) return config;

    check_map(root, "configuration", {"log", "defaults", "checker", "resolver", "rdap"});
    if (auto node = root["log"]) parse_log(node, config.logging);
    if (auto node = root["defaults"]) parse_defaults(node, config.defaults);
    if (auto node = root["checker"]) parse_checker(node, config.checker);
    if (auto node = root["resolver"]) parse_resolver(node, config.resolver);
    if (auto node = root["rdap"]) parse_rdap(node, config.rdap);
    return config;
}
}  // namespace

Config load_config(const std::string &path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &e) {
        throw ConfigError(fmt::format("Failed to load {}: {}", path, e.what()));
    }

    auto config = from_yaml(root);
    apply_environment(config);
    return config;
}

Config parse_config(const std::string &yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception &e) {
        throw ConfigError(fmt::format("Failed to parse configuration: {}", e.what()));
    }

    auto config = from_yaml(root);
    apply_environment(config);
    return config;
}

void apply_environment(Config &config) {
    if (const char *url = std::getenv("FORSALE_RDAP_BOOTSTRAP_URL"); url != nullptr && *url != '\0') {
        if (!std::string_view{url}.starts_with("https://")) {
            throw ConfigError("FORSALE_RDAP_BOOTSTRAP_URL must be an https URL");
        }
        config.rdap.bootstrap_url = url;
    }
}

ResolverConfig to_resolver_config(const ResolverSettings &settings) {
    return ResolverConfig{
        .nameserver = settings.nameserver,
        .use_root_nameservers = settings.use_root_nameservers,
        .port = settings.port,
        .enable_rd = settings.enable_rd,
        .cookies = settings.cookies,
    };
}

std::unique_ptr<SaleStatusChecker> make_checker(const Config &config) {
    log::init(config.logging);

    auto checker_config = config.checker;
    checker_config.default_options = config.defaults;
    auto resolver = std::make_shared<DnssecRecordResolver>(to_resolver_config(config.resolver));
    auto rdap_checker = std::make_shared<CurlRdapChecker>(config.rdap);
    return std::make_unique<SaleStatusChecker>(std::move(resolver), std::move(rdap_checker), checker_config);
}
}  // namespace forsale
