#include "encode.hh"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {
const char *const BASE64_TABLE = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
const char *const BASE32HEX_TABLE = "0123456789abcdefghijklmnopqrstuv";
const char *const HEX_TABLE = "0123456789ABCDEF";

int hex_value(char ch) {
    if ('0' <= ch && ch <= '9') return ch - '0';
    if ('a' <= ch && ch <= 'f') return ch - 'a' + 10;
    if ('A' <= ch && ch <= 'F') return ch - 'A' + 10;
    return -1;
}
}  // namespace

std::string base64_encode(const std::vector<uint8_t> &src) {
    std::string output;
    output.reserve(((src.size() + 2) / 3) * 4);

    auto it = src.cbegin();
    while (src.cend() - it >= 3) {
        output.push_back(BASE64_TABLE[it[0] >> 2]);
        output.push_back(BASE64_TABLE[((it[0] & 0b11) << 4) | (it[1] >> 4)]);
        output.push_back(BASE64_TABLE[((it[1] & 0b1111) << 2) | (it[2] >> 6)]);
        output.push_back(BASE64_TABLE[it[2] & 0b111111]);
        it += 3;
    }

    switch (src.cend() - it) {
        case 1:
            output.push_back(BASE64_TABLE[it[0] >> 2]);
            output.push_back(BASE64_TABLE[(it[0] & 0b11) << 4]);
            output.append("==");
            break;
        case 2:
            output.push_back(BASE64_TABLE[it[0] >> 2]);
            output.push_back(BASE64_TABLE[((it[0] & 0b11) << 4) | (it[1] >> 4)]);
            output.push_back(BASE64_TABLE[(it[1] & 0b1111) << 2]);
            output.push_back('=');
            break;
        default: break;
    }

    return output;
}

// NSEC3 hashes are written without padding (RFC5155 Section 3.3).
std::string base32hex_encode(const std::vector<uint8_t> &src) {
    std::string output;
    output.reserve((src.size() * 8 + 4) / 5);

    uint32_t bits = 0;
    int bit_count = 0;
    for (auto byte : src) {
        bits = (bits << 8) | byte;
        bit_count += 8;
        while (bit_count >= 5) {
            bit_count -= 5;
            output.push_back(BASE32HEX_TABLE[(bits >> bit_count) & 0b11111]);
        }
    }
    if (bit_count > 0) output.push_back(BASE32HEX_TABLE[(bits << (5 - bit_count)) & 0b11111]);

    return output;
}

std::string hex_encode(const std::vector<uint8_t> &src) {
    std::string output;
    output.reserve(src.size() * 2);

    for (auto byte : src) {
        output.push_back(HEX_TABLE[(byte >> 4) & 0x0F]);
        output.push_back(HEX_TABLE[byte & 0x0F]);
    }

    return output;
}

std::optional<std::vector<uint8_t>> hex_decode(std::string_view src) {
    if (src.size() % 2 != 0) return std::nullopt;

    std::vector<uint8_t> output;
    output.reserve(src.size() / 2);
    for (size_t i = 0; i < src.size(); i += 2) {
        auto high = hex_value(src[i]);
        auto low = hex_value(src[i + 1]);
        if (high < 0 || low < 0) return std::nullopt;
        output.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return output;
}
