#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

std::string base64_encode(const std::vector<uint8_t> &src);
// Base 32 Encoding with Extended Hex Alphabet (RFC4648), lowercase, as used by NSEC3 owner names.
std::string base32hex_encode(const std::vector<uint8_t> &src);
std::string hex_encode(const std::vector<uint8_t> &src);

// Accepts upper and lower case digits. Returns nullopt on odd length or a non-hex character.
std::optional<std::vector<uint8_t>> hex_decode(std::string_view src);
