#include "sale.hh"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <json/json.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

namespace forsale {
namespace {
Json::Value optional_to_json(const std::optional<std::string> &value) {
    return value.has_value() ? Json::Value{*value} : Json::Value{Json::nullValue};
}
}  // namespace

void validate_options(const SaleOptions &options) {
    if (options.timeout <= std::chrono::milliseconds::zero() || options.timeout > MAX_TIMEOUT) {
        throw std::invalid_argument(fmt::format("Timeout must be in (0, {}], got {}", MAX_TIMEOUT, options.timeout));
    }
    if (options.cache_ttl < std::chrono::seconds::zero() || options.cache_ttl > MAX_CACHE_TTL) {
        throw std::invalid_argument(
            fmt::format("Cache TTL must be in [0, {}], got {}", MAX_CACHE_TTL, options.cache_ttl));
    }
}

std::string_view error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidDomain:         return "InvalidDomain";
        case ErrorKind::Timeout:               return "Timeout";
        case ErrorKind::NxDomain:              return "NxDomain";
        case ErrorKind::ResolutionError:       return "ResolutionError";
        case ErrorKind::DnssecValidationError: return "DnssecValidationError";
        case ErrorKind::SchemaError:           return "SchemaError";
        case ErrorKind::RdapUnreachable:       return "RdapUnreachable";
        case ErrorKind::OfferExpired:          return "OfferExpired";
    }
    return "Unknown";
}

std::string_view schema_reason_to_string(SchemaReason reason) {
    switch (reason) {
        case SchemaReason::MalformedJson:    return "MalformedJson";
        case SchemaReason::UnknownKey:       return "UnknownKey";
        case SchemaReason::BadPattern:       return "BadPattern";
        case SchemaReason::SizeExceeded:     return "SizeExceeded";
        case SchemaReason::DisallowedScheme: return "DisallowedScheme";
    }
    return "Unknown";
}

std::string_view source_to_string(Source source) {
    switch (source) {
        case Source::Dns:  return "dns";
        case Source::Rdap: return "rdap";
    }
    return "unknown";
}

bool SaleResponse::has_error(ErrorKind kind) const {
    return std::ranges::any_of(errors, [kind](const SaleError &error) { return error.kind == kind; });
}

Json::Value to_json(const SaleResponse &response) {
    Json::Value root{Json::objectValue};
    root["domain"] = response.domain;
    root["forSale"] = response.for_sale;
    root["price"] = optional_to_json(response.payload.price);
    root["url"] = optional_to_json(response.payload.url);
    root["contact"] = optional_to_json(response.payload.contact);
    root["expires"] = optional_to_json(response.payload.expires);

    Json::Value sources{Json::arrayValue};
    for (auto source : response.sources) sources.append(std::string{source_to_string(source)});
    root["source"] = sources;

    Json::Value errors{Json::arrayValue};
    for (const auto &error : response.errors) errors.append(std::string{error_kind_to_string(error.kind)});
    root["errors"] = errors;
    return root;
}

std::string to_json_string(const SaleResponse &response) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, to_json(response));
}
}  // namespace forsale
