#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "rdap.hh"
#include "record_resolver.hh"
#include "sale.hh"

// Serves a fixed answer or error and counts how often it was asked.
class StubRecordResolver : public forsale::RecordResolver {
public:
    explicit StubRecordResolver(forsale::RawAnswer answer, std::chrono::milliseconds delay = {})
        : answer(std::move(answer)), delay(delay) {}

    StubRecordResolver(ResolveErrorKind error, std::chrono::milliseconds delay = {}) : error(error), delay(delay) {}

    forsale::RawAnswer resolve(const std::string &domain, std::chrono::milliseconds) override {
        calls++;
        last_domain = domain;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (error.has_value()) throw ResolveError(*error, "stubbed failure");
        return answer;
    }

    std::atomic<int> calls{0};
    std::string last_domain;

private:
    forsale::RawAnswer answer{};
    std::optional<ResolveErrorKind> error{std::nullopt};
    std::chrono::milliseconds delay;
};

class StubRdapChecker : public forsale::RdapChecker {
public:
    explicit StubRdapChecker(forsale::RdapResult result, std::chrono::milliseconds delay = {})
        : result(result), delay(delay) {}

    forsale::RdapResult cross_check(const std::string &, std::chrono::milliseconds) override {
        calls++;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        return result;
    }

    std::atomic<int> calls{0};

private:
    forsale::RdapResult result;
    std::chrono::milliseconds delay;
};

inline forsale::RawAnswer signed_answer(std::vector<std::string> strings, uint32_t ttl = 300) {
    forsale::RawAnswer answer{.records = {}, .dnssec_authenticated = true, .rcode = RCode::Success};
    for (auto &string : strings) answer.records.push_back({std::move(string), ttl});
    return answer;
}
