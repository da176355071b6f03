#include "dns.hh"
#include <arpa/inet.h>
#include <fmt/format.h>
#include <netinet/in.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>
#include "dnssec.hh"
#include "encode.hh"
#include "write.hh"

namespace {
template <std::integral T>
T random_int() {
    T result;
    if (RAND_bytes(reinterpret_cast<unsigned char *>(&result), sizeof(result)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return result;
}

void write_opt(std::vector<uint8_t> &buffer, const RequestOptions &options, DNSCookies &cookies) {
    write_u8(buffer, 0);  // owner must be the root
    write_u16(buffer, RRType::OPT);
    write_u16(buffer, options.payload_size);
    write_u8(buffer, 0);  // extended rcode
    write_u8(buffer, EDNS_VERSION);
    write_u16(buffer, static_cast<uint16_t>(options.enable_dnssec) << 15);

    if (!options.enable_cookies) {
        write_u16(buffer, 0);
        return;
    }

    // Client cookie is generated once per resolver and echoed back together with the server cookie (RFC7873).
    if (!cookies.client.has_value()) cookies.client = random_int<uint64_t>();
    auto client_cookie = *cookies.client;
    auto option_length = static_cast<uint16_t>(sizeof(client_cookie) + cookies.server.size());
    write_u16(buffer, 4 + option_length);
    write_u16(buffer, OptionCode::Cookies);
    write_u16(buffer, option_length);
    write_bytes(buffer, reinterpret_cast<const uint8_t *>(&client_cookie), sizeof(client_cookie));
    write_bytes(buffer, cookies.server.cbegin(), cookies.server.size());
}

class ResponseReader {
public:
    explicit ResponseReader(const std::vector<uint8_t> &buffer, size_t offset = 0) : buffer(buffer), offset(offset) {}

    Response read_message(uint16_t request_id, const std::string &qname, RRType qtype) {
        auto id = read_u16();
        auto flags = read_u16();
        auto question_count = read_u16();
        auto answer_count = read_u16();
        auto authority_count = read_u16();
        auto additional_count = read_u16();

        if (id != request_id) throw std::runtime_error("Response ID does not match the request");
        if (((flags >> 15) & 1) == 0) throw std::runtime_error("Received a query instead of a response");
        if (static_cast<OpCode>((flags >> 11) & 0b1111) != OpCode::Query) {
            throw std::runtime_error("Response has unexpected opcode");
        }
        if ((flags >> 9) & 1) throw std::runtime_error("Response is truncated");
        if (question_count != 1) throw std::runtime_error("Response must echo exactly one question");

        if (read_domain() != qname) throw std::runtime_error("Response question has wrong domain");
        if (read_u16<RRType>() != qtype) throw std::runtime_error("Response question has wrong type");
        if (read_u16<DNSClass>() != DNSClass::Internet) throw std::runtime_error("Response question has wrong class");

        Response response{
            .is_authoritative = static_cast<bool>((flags >> 10) & 1),
            .rcode = static_cast<RCode>(flags & 0b1111),
            .answers = read_section(answer_count),
            .authority = read_section(authority_count),
            .additional = read_section(additional_count),
        };
        if (offset != buffer.size()) throw std::runtime_error("Response has trailing bytes");
        return response;
    }

private:
    const std::vector<uint8_t> &buffer;
    size_t offset;

    void ensure_available(size_t size) const {
        if (offset + size > buffer.size()) throw std::runtime_error("Response is too short");
    }

    template <typename Container>
    void read_into(size_t size, Container &container) {
        ensure_available(size);
        container.assign(buffer.cbegin() + offset, buffer.cbegin() + offset + size);
        offset += size;
    }

    // Copies the RDATA starting at `start` without moving the cursor.
    std::vector<uint8_t> rdata_since(size_t start, uint16_t data_length) const {
        if (start + data_length > buffer.size()) throw std::runtime_error("Response is too short");
        return {buffer.cbegin() + start, buffer.cbegin() + start + data_length};
    }

    template <typename T>
        requires std::is_trivially_copyable_v<T>
    T read_raw() {
        T value;
        ensure_available(sizeof(value));
        std::memcpy(&value, buffer.data() + offset, sizeof(value));
        offset += sizeof(value);
        return value;
    }

    uint8_t read_u8() { return read_raw<uint8_t>(); }
    uint16_t read_u16() { return ntohs(read_raw<uint16_t>()); }
    uint32_t read_u32() { return ntohl(read_raw<uint32_t>()); }

    template <CastableEnum<uint8_t> T>
    T read_u8() {
        return static_cast<T>(read_u8());
    }

    template <CastableEnum<uint16_t> T>
    T read_u16() {
        return static_cast<T>(read_u16());
    }

    std::vector<RR> read_section(uint16_t count) {
        std::vector<RR> rrs;
        rrs.reserve(count);
        for (uint16_t i = 0; i < count; i++) rrs.push_back(read_rr());
        return rrs;
    }

    // Compression pointers must point backwards, which also rules out loops.
    void read_labels(bool allow_compression, std::string &domain, size_t limit) {
        for (;;) {
            auto byte = read_u8();
            auto label_type = byte & 0b11000000;
            auto label_data = byte & 0b00111111;

            if (label_type == 0b00000000) {
                if (label_data == 0) return;
                ensure_available(label_data);
                std::transform(buffer.cbegin() + offset, buffer.cbegin() + offset + label_data,
                               std::back_inserter(domain), [](uint8_t ch) { return std::tolower(ch); });
                offset += label_data;
                domain.push_back('.');
                if (domain.length() > MAX_DOMAIN_LENGTH) throw std::runtime_error("Domain is too long");
            } else if (label_type == 0b11000000 && allow_compression) {
                size_t pointer = (static_cast<size_t>(label_data) << 8) | read_u8();
                if (pointer >= limit) throw std::runtime_error("Invalid compression pointer");

                ResponseReader pointed{buffer, pointer};
                pointed.read_labels(true, domain, pointer);
                return;
            } else {
                throw std::runtime_error("Invalid label type");
            }
        }
    }

    std::string read_domain(bool allow_compression = true) {
        std::string domain;
        read_labels(allow_compression, domain, offset);
        if (domain.empty()) return ".";
        return domain;
    }

    std::string read_char_string() {
        auto length = read_u8();
        std::string str;
        read_into(length, str);
        return str;
    }

    TXT read_txt(uint16_t data_length) {
        TXT txt;
        auto end = offset + data_length;
        while (offset < end) txt.strings.push_back(read_char_string());
        if (offset != end) throw std::runtime_error("TXT character-string overruns RDATA");
        return txt;
    }

    OPT read_opt(uint16_t data_length, RR &rr, uint16_t rr_class) {
        if (rr.domain != ".") throw std::runtime_error("OPT must be owned by the root");

        // CLASS carries the payload size and TTL carries extended flags (RFC6891).
        OPT opt{
            .udp_payload_size = std::max(rr_class, STANDARD_UDP_PAYLOAD_SIZE),
            .upper_extended_rcode = static_cast<uint8_t>(rr.ttl >> 24),
            .cookies = std::nullopt,
            .dnssec_ok = static_cast<bool>((rr.ttl >> 15) & 1),
        };
        auto edns_version = static_cast<uint8_t>(rr.ttl >> 16);
        rr.ttl = 0;
        if (edns_version > EDNS_VERSION) throw std::runtime_error("Unsupported EDNS version");

        auto end = offset + data_length;
        while (offset < end) {
            auto option_code = read_u16<OptionCode>();
            auto option_length = read_u16();
            if (offset + option_length > end) throw std::runtime_error("EDNS option overruns RDATA");

            if (option_code == OptionCode::Cookies) {
                if (option_length < 16 || option_length > 40) throw std::runtime_error("Invalid cookies length");
                opt.cookies = DNSCookies{};
                opt.cookies->client = read_raw<uint64_t>();
                read_into(option_length - sizeof(uint64_t), opt.cookies->server);
            } else {
                offset += option_length;
            }
        }
        return opt;
    }

    // Digest length is checked against the algorithm during validation so that unknown algorithms are skipped.
    DS read_ds(uint16_t data_length) {
        if (data_length <= 4) throw std::runtime_error("DS has no digest");
        auto start = offset;
        DS ds{
            .key_tag = read_u16(),
            .signing_algorithm = read_u8<SigningAlgorithm>(),
            .digest_algorithm = read_u8<DigestAlgorithm>(),
            .digest = {},
            .data = rdata_since(start, data_length),
        };
        read_into(data_length - 4, ds.digest);
        return ds;
    }

    RRSIG read_rrsig(uint16_t data_length) {
        auto start = offset;
        RRSIG rrsig;
        rrsig.type_covered = read_u16<RRType>();
        rrsig.algorithm = read_u8<SigningAlgorithm>();
        rrsig.labels = read_u8();
        rrsig.original_ttl = read_u32();
        rrsig.expiration_time = read_u32();
        rrsig.inception_time = read_u32();
        rrsig.key_tag = read_u16();
        rrsig.signer_name = read_domain(false);

        auto header_length = offset - start;
        if (header_length >= data_length) throw std::runtime_error("RRSIG has no signature");
        rrsig.data = rdata_since(start, header_length);
        read_into(data_length - header_length, rrsig.signature);
        return rrsig;
    }

    std::unordered_set<RRType> read_type_bitmap(size_t data_length) {
        std::unordered_set<RRType> types;
        auto end = offset + data_length;
        while (offset < end) {
            auto window = read_u8();
            auto bitmap_length = read_u8();
            if (bitmap_length < 1 || bitmap_length > 32) throw std::runtime_error("Invalid type bitmap length");

            ensure_available(bitmap_length);
            for (uint16_t i = 0; i < bitmap_length; i++) {
                auto bits = buffer[offset + i];
                for (uint16_t bit = 0; bit < 8; bit++) {
                    if (bits & (0x80 >> bit)) types.insert(static_cast<RRType>((window << 8) | (i * 8 + bit)));
                }
            }
            offset += bitmap_length;
        }
        if (offset != end) throw std::runtime_error("Type bitmap overruns RDATA");
        return types;
    }

    NSEC read_nsec(uint16_t data_length) {
        auto start = offset;
        NSEC nsec;
        nsec.next_domain = read_domain(false);
        nsec.types = read_type_bitmap(data_length - (offset - start));
        nsec.data = rdata_since(start, data_length);
        return nsec;
    }

    DNSKEY read_dnskey(uint16_t data_length) {
        auto start = offset;
        DNSKEY dnskey;
        dnskey.flags = read_u16();
        dnskey.is_zone_key = (dnskey.flags >> 8) & 1;
        dnskey.is_secure_entry = dnskey.flags & 1;
        dnskey.protocol = read_u8();
        dnskey.algorithm = read_u8<SigningAlgorithm>();
        if (!dnskey.is_zone_key) throw std::runtime_error("DNSKEY is not a zone key");
        if (dnskey.protocol != DNSKEY_PROTOCOL) throw std::runtime_error("Invalid DNSKEY protocol");
        if (data_length <= 4) throw std::runtime_error("DNSKEY has no key");

        read_into(data_length - 4, dnskey.key);
        dnskey.data = rdata_since(start, data_length);
        dnskey.key_tag = dnssec::compute_key_tag(dnskey.data);
        return dnskey;
    }

    NSEC3 read_nsec3(uint16_t data_length) {
        auto start = offset;
        NSEC3 nsec3;
        nsec3.algorithm = read_u8<HashAlgorithm>();
        nsec3.flags = read_u8();
        nsec3.opt_out = nsec3.flags & 1;
        nsec3.iterations = read_u16();
        read_into(read_u8(), nsec3.salt);
        auto hash_length = read_u8();
        if (hash_length == 0) throw std::runtime_error("NSEC3 next hashed owner name is empty");
        read_into(hash_length, nsec3.next_domain_hash);
        nsec3.types = read_type_bitmap(data_length - (offset - start));
        nsec3.data = rdata_since(start, data_length);
        return nsec3;
    }

    RR read_rr() {
        RR rr;
        rr.domain = read_domain();
        rr.type = read_u16<RRType>();
        auto rr_class = read_u16();
        rr.ttl = read_u32();
        auto data_length = read_u16();
        ensure_available(data_length);

        if (rr.type != RRType::OPT) {
            if (rr_class != std::to_underlying(DNSClass::Internet)) throw std::runtime_error("Unknown DNS class");
            // Values with the MSB set are treated as zero (RFC2181).
            if (rr.ttl > MAX_TTL) rr.ttl = 0;
        }

        auto start = offset;
        switch (rr.type) {
            case RRType::A:
                if (data_length != sizeof(in_addr_t)) throw std::runtime_error("Invalid A length");
                rr.data = A{.address = read_raw<in_addr_t>()};
                break;
            case RRType::AAAA:
                if (data_length != sizeof(in6_addr)) throw std::runtime_error("Invalid AAAA length");
                rr.data = AAAA{.address = read_raw<in6_addr>()};
                break;
            case RRType::NS:    rr.data = NS{.domain = read_domain()}; break;
            case RRType::CNAME: rr.data = CNAME{.domain = read_domain()}; break;
            case RRType::SOA:
                rr.data = SOA{
                    .master_name = read_domain(),
                    .rname = read_domain(),
                    .serial = read_u32(),
                    .refresh = read_u32(),
                    .retry = read_u32(),
                    .expire = read_u32(),
                    .negative_ttl = read_u32(),
                };
                break;
            case RRType::TXT:    rr.data = read_txt(data_length); break;
            case RRType::OPT:    rr.data = read_opt(data_length, rr, rr_class); break;
            case RRType::DS:     rr.data = read_ds(data_length); break;
            case RRType::RRSIG:  rr.data = read_rrsig(data_length); break;
            case RRType::NSEC:   rr.data = read_nsec(data_length); break;
            case RRType::DNSKEY: rr.data = read_dnskey(data_length); break;
            case RRType::NSEC3:  rr.data = read_nsec3(data_length); break;
            default:
                rr.data = Unknown{.data = rdata_since(start, data_length)};
                offset += data_length;
                break;
        }
        if (offset != start + data_length) throw std::runtime_error(fmt::format("Malformed {} RDATA", rr.type));
        return rr;
    }
};

std::string address_to_string(int family, const void *address) {
    char str[INET6_ADDRSTRLEN];
    if (inet_ntop(family, address, str, sizeof(str)) == nullptr) return "?";
    return str;
}
}  // namespace

uint16_t write_request(std::vector<uint8_t> &buffer, const RequestOptions &options, const std::string &qname,
                       RRType qtype, DNSCookies &cookies) {
    auto id = random_int<uint16_t>();

    write_u16(buffer, id);
    write_u16(buffer, static_cast<uint16_t>(options.enable_rd) << 8);
    write_u16(buffer, 1);                             // questions
    write_u16(buffer, 0);                             // answers
    write_u16(buffer, 0);                             // authority
    write_u16(buffer, options.enable_edns ? 1 : 0);  // additional

    write_domain(buffer, qname);
    write_u16(buffer, qtype);
    write_u16(buffer, DNSClass::Internet);

    if (options.enable_edns) write_opt(buffer, options, cookies);
    return id;
}

Response read_response(const std::vector<uint8_t> &buffer, uint16_t request_id, const std::string &qname,
                       RRType qtype) {
    return ResponseReader{buffer}.read_message(request_id, qname, qtype);
}

std::string rr_type_to_string(RRType rr_type) {
    switch (rr_type) {
        case RRType::A:      return "A";
        case RRType::NS:     return "NS";
        case RRType::CNAME:  return "CNAME";
        case RRType::SOA:    return "SOA";
        case RRType::TXT:    return "TXT";
        case RRType::AAAA:   return "AAAA";
        case RRType::DNAME:  return "DNAME";
        case RRType::OPT:    return "OPT";
        case RRType::DS:     return "DS";
        case RRType::RRSIG:  return "RRSIG";
        case RRType::NSEC:   return "NSEC";
        case RRType::DNSKEY: return "DNSKEY";
        case RRType::NSEC3:  return "NSEC3";
        default:             return fmt::format("TYPE{}", std::to_underlying(rr_type));
    }
}

std::string rr_to_string(const RR &rr) {
    auto prefix = fmt::format("{} {} {}", rr.domain, rr.ttl, rr.type);
    return std::visit(
        [&](const auto &data) -> std::string {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, A>) {
                return fmt::format("{} {}", prefix, address_to_string(AF_INET, &data.address));
            } else if constexpr (std::is_same_v<T, AAAA>) {
                return fmt::format("{} {}", prefix, address_to_string(AF_INET6, &data.address));
            } else if constexpr (std::is_same_v<T, NS> || std::is_same_v<T, CNAME>) {
                return fmt::format("{} {}", prefix, data.domain);
            } else if constexpr (std::is_same_v<T, SOA>) {
                return fmt::format("{} {} {} {} {} {} {} {}", prefix, data.master_name, data.rname, data.serial,
                                   data.refresh, data.retry, data.expire, data.negative_ttl);
            } else if constexpr (std::is_same_v<T, TXT>) {
                std::string out = prefix;
                for (const auto &str : data.strings) out += fmt::format(" \"{}\"", str);
                return out;
            } else if constexpr (std::is_same_v<T, OPT>) {
                return fmt::format("{} payload={} do={}", prefix, data.udp_payload_size, data.dnssec_ok);
            } else if constexpr (std::is_same_v<T, DS>) {
                return fmt::format("{} {} {} {} {}", prefix, data.key_tag, std::to_underlying(data.signing_algorithm),
                                   std::to_underlying(data.digest_algorithm), hex_encode(data.digest));
            } else if constexpr (std::is_same_v<T, RRSIG>) {
                return fmt::format("{} {} {} {} {} {} {} {} {} {}", prefix, data.type_covered,
                                   std::to_underlying(data.algorithm), data.labels, data.original_ttl,
                                   data.expiration_time, data.inception_time, data.key_tag, data.signer_name,
                                   base64_encode(data.signature));
            } else if constexpr (std::is_same_v<T, NSEC>) {
                return fmt::format("{} {}", prefix, data.next_domain);
            } else if constexpr (std::is_same_v<T, DNSKEY>) {
                return fmt::format("{} {} {} {} {} key_tag={}", prefix, data.flags, data.protocol,
                                   std::to_underlying(data.algorithm), base64_encode(data.key), data.key_tag);
            } else if constexpr (std::is_same_v<T, NSEC3>) {
                return fmt::format("{} {} {} {} {}", prefix, std::to_underlying(data.algorithm), data.flags,
                                   data.iterations, base32hex_encode(data.next_domain_hash));
            } else {
                return fmt::format("{} \\# {}", prefix, data.data.size());
            }
        },
        rr.data);
}
