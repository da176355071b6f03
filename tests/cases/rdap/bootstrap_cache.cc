#include <json/json.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include "common.hh"
#include "rdap.hh"

using namespace forsale;
using namespace std::chrono_literals;

namespace {
const char *const BOOTSTRAP_URL = "https://registry.test/dns.json";

// Serves the registry and domain objects from memory and counts the requests.
class InMemoryRdapChecker : public CurlRdapChecker {
public:
    InMemoryRdapChecker(RdapConfig config, bool registry_available)
        : CurlRdapChecker(std::move(config)), registry_available(registry_available) {}

    mutable std::atomic<int> registry_fetches{0};
    mutable std::atomic<int> domain_fetches{0};

protected:
    Json::Value fetch_json(const std::string &url, std::chrono::steady_clock::time_point) const override {
        if (url == BOOTSTRAP_URL) {
            registry_fetches++;
            if (!registry_available) throw std::runtime_error("Registry is down");

            Json::Value suffixes(Json::arrayValue);
            suffixes.append("com");
            Json::Value urls(Json::arrayValue);
            urls.append("https://rdap.test/");
            Json::Value service(Json::arrayValue);
            service.append(suffixes);
            service.append(urls);

            Json::Value registry;
            registry["services"].append(service);
            return registry;
        }

        ASSERT(url == "https://rdap.test/domain/example.com");
        domain_fetches++;
        Json::Value domain;
        domain["status"].append("for sale");
        return domain;
    }

private:
    bool registry_available;
};
}  // namespace

int main() {
    // The registry is fetched once and reused for later lookups.
    {
        InMemoryRdapChecker checker{RdapConfig{.bootstrap_url = BOOTSTRAP_URL}, true};
        for (int i = 0; i < 3; i++) {
            auto result = checker.cross_check("example.com", 1000ms);
            ASSERT(result.reachable);
            ASSERT(result.tag_present);
        }
        ASSERT(checker.registry_fetches == 1);
        ASSERT(checker.domain_fetches == 3);
    }

    // A failed fetch is remembered, later lookups fail fast without asking the registry again.
    {
        InMemoryRdapChecker checker{RdapConfig{.bootstrap_url = BOOTSTRAP_URL}, false};
        for (int i = 0; i < 3; i++) {
            auto result = checker.cross_check("example.com", 1000ms);
            ASSERT(!result.reachable);
            ASSERT(!result.timed_out);
        }
        ASSERT(checker.registry_fetches == 1);
        ASSERT(checker.domain_fetches == 0);
    }

    // Until the failure is forgotten.
    {
        InMemoryRdapChecker checker{RdapConfig{.bootstrap_url = BOOTSTRAP_URL, .bootstrap_failure_ttl = 0s}, false};
        checker.cross_check("example.com", 1000ms);
        checker.cross_check("example.com", 1000ms);
        ASSERT(checker.registry_fetches == 2);
    }
    return EXIT_SUCCESS;
}
