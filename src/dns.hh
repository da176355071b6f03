#pragma once

#include <fmt/format.h>
#include <netinet/in.h>
#include <cassert>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

static const constexpr uint16_t DNS_PORT = 53;

static const constexpr uint16_t STANDARD_UDP_PAYLOAD_SIZE = 512;  // RFC1035
static const constexpr uint16_t EDNS_UDP_PAYLOAD_SIZE = 4096;     // RFC6891

static const constexpr size_t MAX_DOMAIN_LENGTH = 254;
static const constexpr size_t MAX_LABEL_LENGTH = 63;
static const constexpr size_t MAX_CHAR_STRING_LENGTH = 255;

static const constexpr uint32_t MAX_TTL = 2147483647;  // RFC2181

// https://www.iana.org/assignments/dns-parameters/dns-parameters.xhtml#dns-parameters-2
enum class DNSClass : uint16_t {
    Internet = 1,
};

// https://www.iana.org/assignments/dns-parameters/dns-parameters.xhtml#dns-parameters-5
enum class OpCode : uint16_t {
    Query = 0,
};

// https://www.iana.org/assignments/dns-parameters/dns-parameters.xhtml#dns-parameters-4
enum class RRType : uint16_t {
    A = 1,
    NS = 2,
    CNAME = 5,
    SOA = 6,
    TXT = 16,
    AAAA = 28,
    DNAME = 39,
    OPT = 41,
    DS = 43,
    RRSIG = 46,
    NSEC = 47,
    DNSKEY = 48,
    NSEC3 = 50,
};

// https://www.iana.org/assignments/dns-parameters/dns-parameters.xhtml#dns-parameters-6
enum class RCode : uint16_t {
    Success = 0,
    FormatError = 1,
    ServerError = 2,
    NameError = 3,
    NotImplemented = 4,
    Refused = 5,
    BadVersion = 16,
    BadCookie = 23,
};

// https://www.iana.org/assignments/dns-parameters/dns-parameters.xhtml#dns-parameters-14
static const constexpr uint8_t EDNS_VERSION = 0;

static const constexpr uint8_t DNSKEY_PROTOCOL = 3;  // RFC4034

// https://www.iana.org/assignments/dns-parameters/dns-parameters.xhtml#dns-parameters-11
enum class OptionCode : uint16_t {
    Cookies = 10,
};

// https://www.iana.org/assignments/dns-sec-alg-numbers/dns-sec-alg-numbers.xhtml
enum class SigningAlgorithm : uint8_t {
    RSASHA1 = 5,
    RSASHA256 = 8,
    RSASHA512 = 10,
    ECDSAP256SHA256 = 13,
    ECDSAP384SHA384 = 14,
    ED25519 = 15,
    ED448 = 16,
};

// https://www.iana.org/assignments/ds-rr-types/ds-rr-types.xhtml
enum class DigestAlgorithm : uint8_t {
    SHA1 = 1,
    SHA256 = 2,
    SHA384 = 4,
};

// https://www.iana.org/assignments/dnssec-nsec3-parameters/dnssec-nsec3-parameters.xhtml
enum class HashAlgorithm : uint8_t {
    SHA1 = 1,
};

struct A {
    in_addr_t address;
};

struct NS {
    std::string domain;
};

struct CNAME {
    std::string domain;
};

struct SOA {
    std::string master_name;
    std::string rname;
    uint32_t serial;
    uint32_t refresh;
    uint32_t retry;
    uint32_t expire;
    uint32_t negative_ttl;
};

struct TXT {
    std::vector<std::string> strings;
};

struct AAAA {
    struct in6_addr address;
};

struct DNSCookies {
    std::optional<uint64_t> client;
    std::vector<uint8_t> server;
};

struct OPT {
    uint16_t udp_payload_size;
    uint8_t upper_extended_rcode;
    std::optional<DNSCookies> cookies;
    bool dnssec_ok;
};

struct DS {
    uint16_t key_tag;
    SigningAlgorithm signing_algorithm;
    DigestAlgorithm digest_algorithm;
    std::vector<uint8_t> digest;
    std::vector<uint8_t> data;
};

struct RRSIG {
    RRType type_covered;
    SigningAlgorithm algorithm;
    uint8_t labels;
    uint32_t original_ttl;
    uint32_t expiration_time;
    uint32_t inception_time;
    uint16_t key_tag;
    std::string signer_name;
    std::vector<uint8_t> signature;
    // Data does not include the signature since it is only used to authenticate it.
    std::vector<uint8_t> data;
};

struct NSEC {
    std::string next_domain;
    std::unordered_set<RRType> types;
    std::vector<uint8_t> data;
};

struct DNSKEY {
    uint16_t flags;
    bool is_zone_key;
    bool is_secure_entry;
    uint8_t protocol;
    SigningAlgorithm algorithm;
    std::vector<uint8_t> key;
    std::vector<uint8_t> data;
    uint16_t key_tag;
};

struct NSEC3 {
    HashAlgorithm algorithm;
    uint8_t flags;
    bool opt_out;
    uint16_t iterations;
    std::vector<uint8_t> salt;
    std::vector<uint8_t> next_domain_hash;
    std::unordered_set<RRType> types;
    std::vector<uint8_t> data;
};

// Types without a variant alternative keep their raw RDATA so that they can still be signed.
struct Unknown {
    std::vector<uint8_t> data;
};

struct RR {
    std::string domain;
    RRType type;
    uint32_t ttl;
    std::variant<A, NS, CNAME, SOA, TXT, AAAA, OPT, DS, RRSIG, NSEC, DNSKEY, NSEC3, Unknown> data;
};

struct Response {
    bool is_authoritative;
    RCode rcode;
    std::vector<RR> answers;
    std::vector<RR> authority;
    std::vector<RR> additional;
};

struct RequestOptions {
    uint16_t payload_size;
    bool enable_rd;
    bool enable_edns;
    bool enable_dnssec;
    bool enable_cookies;
};

uint16_t write_request(std::vector<uint8_t> &buffer, const RequestOptions &options, const std::string &qname,
                       RRType qtype, DNSCookies &cookies);
Response read_response(const std::vector<uint8_t> &buffer, uint16_t request_id, const std::string &qname, RRType qtype);

std::string rr_type_to_string(RRType rr_type);
std::string rr_to_string(const RR &rr);

// Moves to the parent domain, returns false for the root.
inline bool pop_label(std::string_view &domain) {
    if (domain == ".") return false;
    auto next_label_index = domain.find('.');
    assert(next_label_index != std::string::npos);
    if (next_label_index != domain.length() - 1) next_label_index++;
    domain.remove_prefix(next_label_index);
    return true;
}

template <>
struct fmt::formatter<RRType> : fmt::formatter<std::string_view> {
    auto format(RRType rr_type, fmt::format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(rr_type_to_string(rr_type), ctx);
    }
};

template <>
struct fmt::formatter<RR> : fmt::formatter<std::string_view> {
    auto format(const RR &rr, fmt::format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(rr_to_string(rr), ctx);
    }
};
