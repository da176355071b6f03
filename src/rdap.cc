#include "rdap.hh"
#include <curl/curl.h>
#include <fmt/format.h>
#include <json/json.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "log.hh"

namespace forsale {
namespace {
std::once_flag curl_init_flag;

class rdap_error : public std::runtime_error {
public:
    rdap_error(const std::string &message, bool timed_out = false)
        : std::runtime_error(message), timed_out(timed_out) {}

    bool timed_out;
};

struct CurlEasyDeleter {
    void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct ResponseBody {
    std::string data;
    size_t limit;
    bool truncated{false};
};

size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *body = static_cast<ResponseBody *>(userdata);
    auto length = size * nmemb;
    if (body->data.size() + length > body->limit) {
        body->truncated = true;
        return 0;
    }
    body->data.append(ptr, length);
    return length;
}

std::string to_lower(std::string str) {
    std::ranges::transform(str, str.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool matches_suffix(const std::string &domain, const std::string &suffix) {
    if (domain == suffix) return true;
    return domain.length() > suffix.length() && domain.ends_with(suffix)
           && domain[domain.length() - suffix.length() - 1] == '.';
}

void check(CURLcode code) {
    if (code != CURLE_OK) {
        throw std::runtime_error(fmt::format("Failed to set up transfer: {}", curl_easy_strerror(code)));
    }
}
}  // namespace

std::vector<RdapService> parse_bootstrap(const Json::Value &registry) {
    if (!registry.isObject() || !registry["services"].isArray()) {
        throw std::runtime_error("Bootstrap registry has no services");
    }

    std::vector<RdapService> result;
    for (const auto &service : registry["services"]) {
        if (!service.isArray() || service.size() < 2 || !service[0].isArray() || !service[1].isArray()) {
            throw std::runtime_error("Malformed bootstrap service");
        }

        std::optional<std::string> base_url;
        for (const auto &url : service[1]) {
            if (url.isString() && url.asString().starts_with("https://")) {
                base_url = url.asString();
                break;
            }
        }
        if (!base_url.has_value()) continue;
        while (base_url->ends_with('/')) base_url->pop_back();

        for (const auto &suffix : service[0]) {
            if (!suffix.isString()) throw std::runtime_error("Malformed bootstrap service entry");
            auto normalized = to_lower(suffix.asString());
            if (normalized.ends_with('.')) normalized.pop_back();
            if (!normalized.empty()) result.push_back({std::move(normalized), *base_url});
        }
    }
    return result;
}

std::optional<std::string> find_rdap_server(const std::vector<RdapService> &services, const std::string &domain) {
    const RdapService *best = nullptr;
    for (const auto &service : services) {
        if (!matches_suffix(domain, service.suffix)) continue;
        if (best == nullptr || service.suffix.length() > best->suffix.length()) best = &service;
    }
    if (best == nullptr) return std::nullopt;
    return best->base_url;
}

bool has_for_sale_status(const Json::Value &domain_object) {
    if (!domain_object.isObject() || !domain_object["status"].isArray()) return false;

    for (const auto &status : domain_object["status"]) {
        if (!status.isString()) continue;
        auto value = to_lower(status.asString());
        std::ranges::replace(value, '-', ' ');
        if (value == "for sale") return true;
    }
    return false;
}

CurlRdapChecker::CurlRdapChecker(RdapConfig config) : config(std::move(config)) {
    std::call_once(curl_init_flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) throw std::runtime_error("Failed to initialize libcurl");
    });
}

RdapResult CurlRdapChecker::cross_check(const std::string &domain, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    try {
        auto base_url = server_for(domain, deadline);
        auto domain_object = fetch_json(fmt::format("{}/domain/{}", base_url, domain), deadline);

        auto tag_present = has_for_sale_status(domain_object);
        log::debug("RDAP lookup finished", {log::field("domain", domain), log::bool_field("for_sale", tag_present)});
        return RdapResult{.tag_present = tag_present, .reachable = true, .timed_out = false};
    } catch (const rdap_error &e) {
        log::warn("RDAP lookup failed", {log::field("domain", domain), log::field("reason", e.what())});
        return RdapResult{.tag_present = false, .reachable = false, .timed_out = e.timed_out};
    } catch (const std::exception &e) {
        log::warn("RDAP lookup failed", {log::field("domain", domain), log::field("reason", e.what())});
        return RdapResult{};
    }
}

std::shared_ptr<const std::vector<RdapService>> CurlRdapChecker::bootstrap_services(
    std::chrono::steady_clock::time_point deadline) {
    {
        std::lock_guard lock{bootstrap_mutex};
        auto now = std::chrono::steady_clock::now();
        if (services != nullptr && now - services_fetched_at < config.bootstrap_ttl) return services;
        if (bootstrap_failed_at.has_value() && now - *bootstrap_failed_at < config.bootstrap_failure_ttl) {
            throw rdap_error("RDAP bootstrap registry is unavailable");
        }
    }

    std::shared_ptr<const std::vector<RdapService>> fetched;
    try {
        fetched = std::make_shared<const std::vector<RdapService>>(
            parse_bootstrap(fetch_json(config.bootstrap_url, deadline)));
    } catch (const std::exception &) {
        std::lock_guard lock{bootstrap_mutex};
        bootstrap_failed_at = std::chrono::steady_clock::now();
        throw;
    }
    log::debug("Fetched RDAP bootstrap registry", {log::field("services", static_cast<int64_t>(fetched->size()))});

    std::lock_guard lock{bootstrap_mutex};
    services = fetched;
    services_fetched_at = std::chrono::steady_clock::now();
    bootstrap_failed_at.reset();
    return fetched;
}

std::string CurlRdapChecker::server_for(const std::string &domain, std::chrono::steady_clock::time_point deadline) {
    if (std::chrono::steady_clock::now() >= deadline) throw rdap_error("RDAP lookup timed out", true);

    auto server = find_rdap_server(*bootstrap_services(deadline), domain);
    if (!server.has_value()) throw rdap_error(fmt::format("No RDAP server is known for {}", domain));
    return *server;
}

Json::Value CurlRdapChecker::fetch_json(const std::string &url, std::chrono::steady_clock::time_point deadline) const {
    auto time_left
        = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (time_left <= std::chrono::milliseconds::zero()) throw rdap_error("RDAP lookup timed out", true);

    CurlEasyPtr curl{curl_easy_init()};
    if (curl == nullptr) throw std::runtime_error("Failed to create a transfer handle");

    CurlSlistPtr headers{curl_slist_append(nullptr, "Accept: application/rdap+json")};
    if (headers == nullptr) throw std::runtime_error("Failed to allocate headers");

    ResponseBody body{.data = {}, .limit = config.max_response_size};
    check(curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str()));
    check(curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "https"));
    check(curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "https"));
    check(curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L));
    check(curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, config.max_redirects));
    check(curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(time_left.count())));
    check(curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L));
    check(curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get()));
    check(curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "forsale"));
    check(curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body));
    check(curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body));

    auto code = curl_easy_perform(curl.get());
    if (code == CURLE_OPERATION_TIMEDOUT) throw rdap_error(fmt::format("Request to {} timed out", url), true);
    if (body.truncated) throw rdap_error(fmt::format("Response from {} is too large", url));
    if (code != CURLE_OK) throw rdap_error(fmt::format("Request to {} failed: {}", url, curl_easy_strerror(code)));

    long status = 0;
    check(curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status));
    if (status != 200) throw rdap_error(fmt::format("Request to {} returned HTTP {}", url, status));

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data.data(), body.data.data() + body.data.size(), &root, &errors)) {
        throw rdap_error(fmt::format("Response from {} is not JSON: {}", url, errors));
    }
    return root;
}
}  // namespace forsale
