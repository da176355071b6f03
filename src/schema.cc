#include "schema.hh"
#include <curl/curl.h>
#include <fmt/format.h>
#include <json/json.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace forsale {
namespace {
const std::array<std::string_view, 4> KNOWN_KEYS = {"price", "url", "contact", "expires"};

struct CurlUrlDeleter {
    void operator()(CURLU *url) const { curl_url_cleanup(url); }
};

struct CurlFreeDeleter {
    void operator()(char *str) const { curl_free(str); }
};

using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;
using CurlStringPtr = std::unique_ptr<char, CurlFreeDeleter>;

bool is_upper(char c) { return 'A' <= c && c <= 'Z'; }
bool is_digit(char c) { return '0' <= c && c <= '9'; }

size_t count_digits(std::string_view str) {
    size_t count = 0;
    while (count < str.length() && is_digit(str[count])) count++;
    return count;
}

// ^[A-Z]{3}:[0-9]+(\.[0-9]+)?$
bool is_price(std::string_view price) {
    if (price.length() < 5) return false;
    if (!is_upper(price[0]) || !is_upper(price[1]) || !is_upper(price[2]) || price[3] != ':') return false;
    price.remove_prefix(4);

    auto integer_digits = count_digits(price);
    if (integer_digits == 0) return false;
    price.remove_prefix(integer_digits);
    if (price.empty()) return true;

    if (price[0] != '.') return false;
    price.remove_prefix(1);
    auto fraction_digits = count_digits(price);
    return fraction_digits > 0 && fraction_digits == price.length();
}

bool is_unsafe_uri_char(char c) {
    auto byte = static_cast<unsigned char>(c);
    return byte < 0x20 || byte == 0x7F || c == ' ' || c == '"' || c == '\'' || c == '<' || c == '>' || c == '\\'
           || c == '`';
}

// RFC3986: scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
std::string_view uri_scheme(std::string_view key, std::string_view uri) {
    auto colon = uri.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        throw SchemaError(SchemaReason::BadPattern, fmt::format("\"{}\" is not an absolute URI", key));
    }

    auto scheme = uri.substr(0, colon);
    if (!std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        throw SchemaError(SchemaReason::BadPattern, fmt::format("\"{}\" has an invalid scheme", key));
    }
    for (auto c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            throw SchemaError(SchemaReason::BadPattern, fmt::format("\"{}\" has an invalid scheme", key));
        }
    }
    return scheme;
}

void check_uri(std::string_view key, std::string_view uri, std::string_view allowed_scheme) {
    for (auto c : uri) {
        if (is_unsafe_uri_char(c)) {
            throw SchemaError(SchemaReason::BadPattern, fmt::format("\"{}\" contains a forbidden character", key));
        }
    }

    if (uri_scheme(key, uri) != allowed_scheme) {
        throw SchemaError(SchemaReason::DisallowedScheme,
                          fmt::format("\"{}\" must use the {} scheme", key, allowed_scheme));
    }
}

void check_https_url(const std::string &url) {
    check_uri("url", url, "https");
    // libcurl tolerates a missing slash after the scheme, the stored URL must carry the authority itself.
    if (!url.starts_with("https://")) throw SchemaError(SchemaReason::BadPattern, "\"url\" has no authority");

    CurlUrlPtr handle{curl_url()};
    if (handle == nullptr) throw std::runtime_error("Failed to allocate a URL handle");

    if (auto result = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0); result != CURLUE_OK) {
        throw SchemaError(SchemaReason::BadPattern, fmt::format("\"url\" is invalid: {}", curl_url_strerror(result)));
    }

    char *host_ptr = nullptr;
    auto result = curl_url_get(handle.get(), CURLUPART_HOST, &host_ptr, 0);
    CurlStringPtr host{host_ptr};
    if (result != CURLUE_OK || host == nullptr || *host == '\0') {
        throw SchemaError(SchemaReason::BadPattern, "\"url\" has no host");
    }
}

void check_mailto_contact(std::string_view contact) {
    check_uri("contact", contact, "mailto");

    auto address = contact.substr(std::strlen("mailto:"));
    address = address.substr(0, address.find('?'));
    auto at = address.find('@');
    if (at == std::string_view::npos || at == 0 || at == address.length() - 1) {
        throw SchemaError(SchemaReason::BadPattern, "\"contact\" has no address");
    }
}

Json::Value parse_object(std::string_view json) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw SchemaError(SchemaReason::MalformedJson, fmt::format("Invalid JSON: {}", errors));
    }
    if (!root.isObject()) throw SchemaError(SchemaReason::MalformedJson, "Payload is not a JSON object");
    return root;
}
}  // namespace

std::optional<std::chrono::year_month_day> parse_date(std::string_view date) {
    if (date.length() != 10 || date[4] != '-' || date[7] != '-') return std::nullopt;
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!is_digit(date[i])) return std::nullopt;
    }

    auto number = [&](size_t start, size_t length) {
        unsigned value = 0;
        for (size_t i = start; i < start + length; i++) value = value * 10 + (date[i] - '0');
        return value;
    };
    std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(number(0, 4))},
                                    std::chrono::month{number(5, 2)}, std::chrono::day{number(8, 2)}};
    if (!ymd.ok()) return std::nullopt;
    return ymd;
}

SalePayload validate(const CandidateRecord &candidate) {
    const auto &content = candidate.content;
    if (content.length() > MAX_RECORD_SIZE) {
        throw SchemaError(SchemaReason::SizeExceeded,
                          fmt::format("Record is {} octets, at most {} are allowed", content.length(),
                                      MAX_RECORD_SIZE));
    }
    if (candidate.version_tag != VERSION_TAG || !content.starts_with(candidate.version_tag)) {
        throw SchemaError(SchemaReason::MalformedJson, "Record does not start with the version tag");
    }

    auto root = parse_object(std::string_view{content}.substr(candidate.version_tag.length()));

    for (const auto &key : root.getMemberNames()) {
        if (std::ranges::find(KNOWN_KEYS, key) == KNOWN_KEYS.end()) {
            throw SchemaError(SchemaReason::UnknownKey, fmt::format("Unknown key \"{}\"", key));
        }
        if (!root[key].isString()) {
            throw SchemaError(SchemaReason::BadPattern, fmt::format("\"{}\" is not a string", key));
        }
    }

    SalePayload payload;
    if (root.isMember("price")) {
        auto price = root["price"].asString();
        if (!is_price(price)) throw SchemaError(SchemaReason::BadPattern, "\"price\" must look like CUR:AMOUNT");
        payload.price = std::move(price);
    }
    if (root.isMember("url")) {
        auto url = root["url"].asString();
        check_https_url(url);
        payload.url = std::move(url);
    }
    if (root.isMember("contact")) {
        auto contact = root["contact"].asString();
        check_mailto_contact(contact);
        payload.contact = std::move(contact);
    }
    if (root.isMember("expires")) {
        auto expires = root["expires"].asString();
        if (!parse_date(expires).has_value()) {
            throw SchemaError(SchemaReason::BadPattern, "\"expires\" must be a YYYY-MM-DD date");
        }
        payload.expires = std::move(expires);
    }
    if (!payload.price.has_value() && !payload.url.has_value() && !payload.contact.has_value()) {
        throw SchemaError(SchemaReason::BadPattern, "Payload needs a price, url or contact");
    }
    return payload;
}
}  // namespace forsale
