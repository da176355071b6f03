#pragma once

#include <fmt/format.h>
#include <json/json.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "dns.hh"

namespace forsale {
static const constexpr char VERSION_TAG[] = "v=FORSALE1;";
static const constexpr size_t MAX_RECORD_SIZE = 255;

static const constexpr std::chrono::milliseconds MAX_TIMEOUT{60'000};
static const constexpr std::chrono::seconds MAX_CACHE_TTL{86'400};

// Per-call options, every field is a part of the cache key.
struct SaleOptions {
    bool enable_rdap_check{false};
    std::chrono::seconds cache_ttl{300};
    std::chrono::milliseconds timeout{5000};

    bool operator==(const SaleOptions &) const = default;
};

// Throws std::invalid_argument when a field is out of bounds.
void validate_options(const SaleOptions &options);

struct TxtString {
    std::string content;
    uint32_t ttl;

    bool operator==(const TxtString &) const = default;
};

// TXT RRset of `_for-sale.<domain>` in answer order.
struct RawAnswer {
    std::vector<TxtString> records;
    bool dnssec_authenticated{false};
    RCode rcode{RCode::Success};
};

struct CandidateRecord {
    std::string version_tag;
    std::string content;
    uint32_t source_ttl;
};

struct SalePayload {
    std::optional<std::string> price;
    std::optional<std::string> url;
    std::optional<std::string> contact;
    std::optional<std::string> expires;

    bool operator==(const SalePayload &) const = default;
};

struct RdapResult {
    bool tag_present{false};
    bool reachable{false};
    bool timed_out{false};
};

enum class ErrorKind {
    InvalidDomain,
    Timeout,
    NxDomain,
    ResolutionError,
    DnssecValidationError,
    SchemaError,
    RdapUnreachable,
    OfferExpired,
};

enum class SchemaReason {
    MalformedJson,
    UnknownKey,
    BadPattern,
    SizeExceeded,
    DisallowedScheme,
};

std::string_view error_kind_to_string(ErrorKind kind);
std::string_view schema_reason_to_string(SchemaReason reason);

class SchemaError : public std::runtime_error {
public:
    SchemaError(SchemaReason reason, const std::string &message) : std::runtime_error(message), reason_(reason) {}

    SchemaReason reason() const { return reason_; }

private:
    SchemaReason reason_;
};

struct SaleError {
    ErrorKind kind;
    std::optional<SchemaReason> reason{std::nullopt};
    std::string detail{};

    bool operator==(const SaleError &) const = default;
};

enum class Source { Dns, Rdap };

std::string_view source_to_string(Source source);

struct SaleResponse {
    std::string domain;
    bool for_sale{false};
    SalePayload payload{};
    std::vector<Source> sources{};
    std::vector<SaleError> errors{};

    bool operator==(const SaleResponse &) const = default;

    bool has_error(ErrorKind kind) const;
};

// Absent payload fields are serialized as null, errors as their kind names.
Json::Value to_json(const SaleResponse &response);
std::string to_json_string(const SaleResponse &response);
}  // namespace forsale

template <>
struct fmt::formatter<forsale::ErrorKind> : fmt::formatter<std::string_view> {
    auto format(forsale::ErrorKind kind, fmt::format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(forsale::error_kind_to_string(kind), ctx);
    }
};

template <>
struct fmt::formatter<forsale::SchemaReason> : fmt::formatter<std::string_view> {
    auto format(forsale::SchemaReason reason, fmt::format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(forsale::schema_reason_to_string(reason), ctx);
    }
};
