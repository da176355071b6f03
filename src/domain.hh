#pragma once

#include <optional>
#include <string>

namespace forsale {
static const constexpr char FOR_SALE_LABEL[] = "_for-sale.";

// Lowercases the domain and strips one trailing dot. Returns nullopt unless every label is a
// 1 to 63 octet LDH label, there are at least two labels and `_for-sale.<domain>.` fits in a DNS name.
std::optional<std::string> normalize_domain(const std::string &domain);
}  // namespace forsale
