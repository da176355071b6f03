#pragma once

#include <json/json.h>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "sale.hh"

namespace forsale {
static const constexpr char IANA_RDAP_BOOTSTRAP_URL[] = "https://data.iana.org/rdap/dns.json";

struct RdapConfig {
    std::string bootstrap_url{IANA_RDAP_BOOTSTRAP_URL};
    std::chrono::seconds bootstrap_ttl{3600};
    // How long a failed registry fetch is remembered before it is tried again.
    std::chrono::seconds bootstrap_failure_ttl{30};
    size_t max_response_size{1024 * 1024};
    long max_redirects{3};
};

class RdapChecker {
public:
    virtual ~RdapChecker() = default;

    // Never throws, every failure is reported as an unreachable result.
    virtual RdapResult cross_check(const std::string &domain, std::chrono::milliseconds timeout) = 0;
};

// Entry of the bootstrap registry (RFC9224), `suffix` is a lowercase domain without the trailing dot.
struct RdapService {
    std::string suffix;
    std::string base_url;
};

// Throws std::runtime_error if the registry is malformed. Services without an https URL are skipped.
std::vector<RdapService> parse_bootstrap(const Json::Value &registry);
// Picks the service with the longest suffix matching `domain`.
std::optional<std::string> find_rdap_server(const std::vector<RdapService> &services, const std::string &domain);
// Whether the top-level `status` array of an RDAP domain object contains "for sale".
bool has_for_sale_status(const Json::Value &domain_object);

class CurlRdapChecker : public RdapChecker {
public:
    explicit CurlRdapChecker(RdapConfig config = {});

    RdapResult cross_check(const std::string &domain, std::chrono::milliseconds timeout) override;

protected:
    // Fetches and parses a JSON document over https. Throws std::runtime_error.
    virtual Json::Value fetch_json(const std::string &url, std::chrono::steady_clock::time_point deadline) const;

private:
    RdapConfig config;

    // Guards the registry only, fetches run without it so that a slow registry does not block other lookups.
    std::mutex bootstrap_mutex;
    std::shared_ptr<const std::vector<RdapService>> services;
    std::chrono::steady_clock::time_point services_fetched_at;
    std::optional<std::chrono::steady_clock::time_point> bootstrap_failed_at;

    std::shared_ptr<const std::vector<RdapService>> bootstrap_services(std::chrono::steady_clock::time_point deadline);
    std::string server_for(const std::string &domain, std::chrono::steady_clock::time_point deadline);
};
}  // namespace forsale
