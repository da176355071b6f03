#include "domain.hh"
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include "dns.hh"

namespace forsale {
namespace {
bool is_ldh_label(std::string_view label) {
    if (label.empty() || label.length() > MAX_LABEL_LENGTH) return false;
    if (label.front() == '-' || label.back() == '-') return false;

    for (auto c : label) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
    }
    return true;
}
}  // namespace

std::optional<std::string> normalize_domain(const std::string &domain) {
    std::string normalized;
    normalized.reserve(domain.length());
    for (auto c : domain) normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (normalized.ends_with('.')) normalized.pop_back();

    // The query name is `_for-sale.<domain>.`
    if (normalized.length() + sizeof(FOR_SALE_LABEL) > MAX_DOMAIN_LENGTH) return std::nullopt;

    size_t labels = 0;
    std::string_view rest{normalized};
    for (;;) {
        auto dot = rest.find('.');
        if (!is_ldh_label(rest.substr(0, dot))) return std::nullopt;
        labels++;
        if (dot == std::string_view::npos) break;
        rest.remove_prefix(dot + 1);
    }
    if (labels < 2) return std::nullopt;
    return normalized;
}
}  // namespace forsale
