#include "dnssec.hh"
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <algorithm>
#include <compare>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <exception>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>
#include "dns.hh"
#include "encode.hh"
#include "log.hh"
#include "write.hh"

namespace {
namespace log = forsale::log;

// RFC9276 recommends treating larger iteration counts as insecure, they are only used for DoS.
const constexpr uint16_t MAX_NSEC3_ITERATIONS = 150;

template <auto Free>
struct OpenSSLDeleter {
    template <typename T>
    void operator()(T *ptr) const {
        Free(ptr);
    }
};

using PKeyPtr = std::unique_ptr<EVP_PKEY, OpenSSLDeleter<EVP_PKEY_free>>;
using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, OpenSSLDeleter<EVP_PKEY_CTX_free>>;
using BignumPtr = std::unique_ptr<BIGNUM, OpenSSLDeleter<BN_free>>;
using ParamBuildPtr = std::unique_ptr<OSSL_PARAM_BLD, OpenSSLDeleter<OSSL_PARAM_BLD_free>>;
using ParamPtr = std::unique_ptr<OSSL_PARAM, OpenSSLDeleter<OSSL_PARAM_free>>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, OpenSSLDeleter<ECDSA_SIG_free>>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, OpenSSLDeleter<EVP_MD_CTX_free>>;

PKeyPtr pkey_from_params(const char *type, OSSL_PARAM *params) {
    PKeyCtxPtr ctx{EVP_PKEY_CTX_new_from_name(nullptr, type, nullptr)};
    if (ctx == nullptr || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
        throw std::runtime_error(fmt::format("Failed to initialize {} key context", type));
    }

    EVP_PKEY *pkey = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY, params) != 1) {
        throw std::runtime_error(fmt::format("Failed to construct {} key", type));
    }
    return PKeyPtr{pkey};
}

// RFC3110: exponent length is one octet, or zero followed by two octets, then the exponent and the modulus.
PKeyPtr load_rsa_key(const std::vector<uint8_t> &key) {
    if (key.size() < 3) throw std::runtime_error("RSA key is too short");

    size_t header_size = 1;
    size_t exponent_length = key[0];
    if (exponent_length == 0) {
        header_size = 3;
        exponent_length = (static_cast<size_t>(key[1]) << 8) | key[2];
    }
    if (exponent_length == 0 || header_size + exponent_length >= key.size()) {
        throw std::runtime_error("Invalid RSA exponent length");
    }

    const auto *exponent = key.data() + header_size;
    const auto *modulus = exponent + exponent_length;
    BignumPtr e{BN_bin2bn(exponent, static_cast<int>(exponent_length), nullptr)};
    BignumPtr n{BN_bin2bn(modulus, static_cast<int>(key.size() - header_size - exponent_length), nullptr)};
    if (e == nullptr || n == nullptr) throw std::runtime_error("Failed to load RSA key");

    ParamBuildPtr builder{OSSL_PARAM_BLD_new()};
    if (builder == nullptr || OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_E, e.get()) != 1
        || OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) != 1) {
        throw std::runtime_error("Failed to build RSA parameters");
    }
    ParamPtr params{OSSL_PARAM_BLD_to_param(builder.get())};
    if (params == nullptr) throw std::runtime_error("Failed to build RSA parameters");
    return pkey_from_params("RSA", params.get());
}

// RFC6605: the key is the concatenation of X and Y, OpenSSL expects an uncompressed point prefix.
PKeyPtr load_ecdsa_key(const std::vector<uint8_t> &key, size_t expected_size, std::string curve) {
    if (key.size() != expected_size) throw std::runtime_error("Invalid ECDSA key length");

    std::vector<uint8_t> point{POINT_CONVERSION_UNCOMPRESSED};
    point.insert(point.end(), key.cbegin(), key.cend());

    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, curve.data(), 0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size()),
        OSSL_PARAM_construct_end(),
    };
    return pkey_from_params("EC", params);
}

PKeyPtr load_eddsa_key(const std::vector<uint8_t> &key, int type) {
    PKeyPtr pkey{EVP_PKEY_new_raw_public_key(type, nullptr, key.data(), key.size())};
    if (pkey == nullptr) throw std::runtime_error("Failed to load EdDSA key");
    return pkey;
}

PKeyPtr load_public_key(const DNSKEY &dnskey) {
    switch (dnskey.algorithm) {
        case SigningAlgorithm::RSASHA1:
        case SigningAlgorithm::RSASHA256:
        case SigningAlgorithm::RSASHA512:       return load_rsa_key(dnskey.key);
        case SigningAlgorithm::ECDSAP256SHA256: return load_ecdsa_key(dnskey.key, 64, "prime256v1");
        case SigningAlgorithm::ECDSAP384SHA384: return load_ecdsa_key(dnskey.key, 96, "secp384r1");
        case SigningAlgorithm::ED25519:         return load_eddsa_key(dnskey.key, EVP_PKEY_ED25519);
        case SigningAlgorithm::ED448:           return load_eddsa_key(dnskey.key, EVP_PKEY_ED448);
        default:                                throw std::runtime_error("Unsupported signing algorithm");
    }
}

// DNSSEC stores ECDSA signatures as raw r|s while OpenSSL verifies DER.
std::vector<uint8_t> ecdsa_signature_to_der(const std::vector<uint8_t> &signature, size_t expected_size) {
    if (signature.size() != expected_size) throw std::runtime_error("Invalid ECDSA signature length");

    auto half = static_cast<int>(signature.size() / 2);
    EcdsaSigPtr sig{ECDSA_SIG_new()};
    BignumPtr r{BN_bin2bn(signature.data(), half, nullptr)};
    BignumPtr s{BN_bin2bn(signature.data() + half, half, nullptr)};
    if (sig == nullptr || r == nullptr || s == nullptr || ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
        throw std::runtime_error("Failed to load ECDSA signature");
    }
    // Owned by the signature now.
    r.release();
    s.release();

    auto der_length = i2d_ECDSA_SIG(sig.get(), nullptr);
    if (der_length <= 0) throw std::runtime_error("Failed to encode ECDSA signature");
    std::vector<uint8_t> der(der_length);
    auto *out = der.data();
    if (i2d_ECDSA_SIG(sig.get(), &out) != der_length) throw std::runtime_error("Failed to encode ECDSA signature");
    return der;
}

std::vector<uint8_t> signature_for_openssl(const RRSIG &rrsig) {
    switch (rrsig.algorithm) {
        case SigningAlgorithm::ECDSAP256SHA256: return ecdsa_signature_to_der(rrsig.signature, 64);
        case SigningAlgorithm::ECDSAP384SHA384: return ecdsa_signature_to_der(rrsig.signature, 96);
        default:                                return rrsig.signature;
    }
}

// EdDSA signs the message itself and takes no digest.
const EVP_MD *signature_digest(SigningAlgorithm algorithm) {
    switch (algorithm) {
        case SigningAlgorithm::RSASHA1:         return EVP_sha1();
        case SigningAlgorithm::RSASHA256:
        case SigningAlgorithm::ECDSAP256SHA256: return EVP_sha256();
        case SigningAlgorithm::ECDSAP384SHA384: return EVP_sha384();
        case SigningAlgorithm::RSASHA512:       return EVP_sha512();
        case SigningAlgorithm::ED25519:
        case SigningAlgorithm::ED448:           return nullptr;
        default:                                throw std::runtime_error("Unsupported signing algorithm");
    }
}

const EVP_MD *ds_digest(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::SHA1:   return EVP_sha1();
        case DigestAlgorithm::SHA256: return EVP_sha256();
        case DigestAlgorithm::SHA384: return EVP_sha384();
        default:                      throw std::runtime_error("Unsupported DS digest algorithm");
    }
}

std::vector<uint8_t> digest(const EVP_MD *md, std::initializer_list<std::pair<const uint8_t *, size_t>> parts) {
    MdCtxPtr ctx{EVP_MD_CTX_new()};
    if (ctx == nullptr || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        throw std::runtime_error("Failed to initialize digest");
    }
    for (const auto &[data, size] : parts) {
        if (EVP_DigestUpdate(ctx.get(), data, size) != 1) throw std::runtime_error("Failed to update digest");
    }

    std::vector<uint8_t> result(EVP_MD_get_size(md));
    if (EVP_DigestFinal_ex(ctx.get(), result.data(), nullptr) != 1) throw std::runtime_error("Failed to finish digest");
    return result;
}

bool verify_signature(const DNSKEY &dnskey, const std::vector<uint8_t> &signed_data,
                      const std::vector<uint8_t> &signature) {
    auto pkey = load_public_key(dnskey);
    MdCtxPtr ctx{EVP_MD_CTX_new()};
    if (ctx == nullptr) throw std::runtime_error("Failed to create verification context");
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, signature_digest(dnskey.algorithm), nullptr, pkey.get()) != 1) {
        throw std::runtime_error("Failed to initialize signature verification");
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), signed_data.data(), signed_data.size())
           == 1;
}

// Labels of a fully qualified domain, from the root down: "a.b." -> {"b", "a"}.
std::vector<std::string_view> labels_of(std::string_view domain) {
    std::vector<std::string_view> labels;
    if (domain == ".") return labels;
    if (domain.ends_with('.')) domain.remove_suffix(1);

    for (;;) {
        auto dot = domain.rfind('.');
        if (dot == std::string_view::npos) {
            labels.push_back(domain);
            return labels;
        }
        labels.push_back(domain.substr(dot + 1));
        domain.remove_suffix(domain.length() - dot);
    }
}

// The ancestor of `labels` made of its `count` topmost labels.
std::string ancestor(const std::vector<std::string_view> &labels, size_t count) {
    if (count == 0) return ".";
    std::string result;
    for (size_t i = count; i > 0; i--) {
        result += labels[i - 1];
        result += '.';
    }
    return result;
}

// Canonical DNS name order (RFC4034 Section 6.1), names are already lowercase.
int compare_names(const std::vector<std::string_view> &a, const std::vector<std::string_view> &b) {
    for (size_t i = 0; i < a.size() && i < b.size(); i++) {
        auto result = std::lexicographical_compare_three_way(
            a[i].cbegin(), a[i].cend(), b[i].cbegin(), b[i].cend(),
            [](char x, char y) { return static_cast<uint8_t>(x) <=> static_cast<uint8_t>(y); });
        if (result != 0) return result < 0 ? -1 : 1;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

int compare_names(std::string_view a, std::string_view b) { return compare_names(labels_of(a), labels_of(b)); }

// Whether `domain` falls strictly between `owner` and `next` of a denial record, the last record wraps around.
bool is_covered(std::string_view domain, std::string_view owner, std::string_view next) {
    auto after_owner = compare_names(owner, domain) < 0;
    auto before_next = compare_names(domain, next) < 0;
    if (compare_names(owner, next) < 0) return after_owner && before_next;
    return after_owner || before_next;
}

std::vector<uint8_t> canonical_rdata(const RR &rr) {
    std::vector<uint8_t> data;
    switch (rr.type) {
        case RRType::A: {
            const auto &address = std::get<A>(rr.data).address;
            write_bytes(data, reinterpret_cast<const uint8_t *>(&address), sizeof(address));
        } break;
        case RRType::AAAA: {
            const auto &address = std::get<AAAA>(rr.data).address;
            write_bytes(data, reinterpret_cast<const uint8_t *>(&address), sizeof(address));
        } break;
        case RRType::NS:    write_domain(data, std::get<NS>(rr.data).domain); break;
        case RRType::CNAME: write_domain(data, std::get<CNAME>(rr.data).domain); break;
        case RRType::SOA:   {
            const auto &soa = std::get<SOA>(rr.data);
            write_domain(data, soa.master_name);
            write_domain(data, soa.rname);
            for (auto value : {soa.serial, soa.refresh, soa.retry, soa.expire, soa.negative_ttl}) {
                write_u32(data, value);
            }
        } break;
        case RRType::TXT:
            for (const auto &str : std::get<TXT>(rr.data).strings) write_char_string(data, str);
            break;
        case RRType::DS:     data = std::get<DS>(rr.data).data; break;
        case RRType::NSEC:   data = std::get<NSEC>(rr.data).data; break;
        case RRType::DNSKEY: data = std::get<DNSKEY>(rr.data).data; break;
        case RRType::NSEC3:  data = std::get<NSEC3>(rr.data).data; break;
        case RRType::OPT:
        case RRType::RRSIG:  throw std::runtime_error(fmt::format("{} cannot be signed", rr.type));
        default:             data = std::get<Unknown>(rr.data).data; break;
    }
    return data;
}

// The data covered by an RRSIG (RFC4034 Section 3.1.8.1): RRSIG RDATA without the signature, then the RRset in
// canonical order with the owner name replaced by the signed (possibly wildcard) name.
std::vector<uint8_t> signed_data(const RRSIG &rrsig, const std::vector<RR> &rrset, std::string_view owner) {
    std::vector<std::vector<uint8_t>> rdatas;
    rdatas.reserve(rrset.size());
    for (const auto &rr : rrset) rdatas.push_back(canonical_rdata(rr));
    std::ranges::sort(rdatas);
    rdatas.erase(std::unique(rdatas.begin(), rdatas.end()), rdatas.end());

    std::vector<uint8_t> owner_wire;
    write_domain(owner_wire, owner);

    std::vector<uint8_t> data{rrsig.data};
    for (const auto &rdata : rdatas) {
        write_bytes(data, owner_wire.cbegin(), owner_wire.size());
        write_u16(data, rrset[0].type);
        write_u16(data, DNSClass::Internet);
        write_u32(data, rrsig.original_ttl);
        write_u16(data, static_cast<uint16_t>(rdata.size()));
        write_bytes(data, rdata.cbegin(), rdata.size());
    }
    return data;
}

bool any_nsec_covers(const std::vector<RR> &nsec_rrset, std::string_view domain) {
    return std::ranges::any_of(nsec_rrset, [&](const RR &rr) {
        return is_covered(domain, rr.domain, std::get<NSEC>(rr.data).next_domain);
    });
}

const NSEC *find_nsec(const std::vector<RR> &nsec_rrset, std::string_view domain) {
    auto it = std::ranges::find(nsec_rrset, domain, &RR::domain);
    return it == nsec_rrset.end() ? nullptr : &std::get<NSEC>(it->data);
}

// Owner name an NSEC3 RR for `domain` would have (RFC5155 Section 5).
std::string hashed_owner(const NSEC3 &params, std::string_view domain, const std::string &zone_domain) {
    if (params.algorithm != HashAlgorithm::SHA1) throw std::runtime_error("Unsupported NSEC3 hash algorithm");
    if (params.iterations > MAX_NSEC3_ITERATIONS) throw std::runtime_error("Too many NSEC3 iterations");

    std::vector<uint8_t> wire;
    write_domain(wire, domain);

    const auto *md = EVP_sha1();
    auto hash = digest(md, {{wire.data(), wire.size()}, {params.salt.data(), params.salt.size()}});
    for (uint16_t i = 0; i < params.iterations; i++) {
        hash = digest(md, {{hash.data(), hash.size()}, {params.salt.data(), params.salt.size()}});
    }
    return base32hex_encode(hash) + "." + zone_domain;
}

const NSEC3 *find_nsec3(const std::vector<RR> &nsec3_rrset, std::string_view domain, const std::string &zone_domain) {
    if (nsec3_rrset.empty()) return nullptr;
    auto owner = hashed_owner(std::get<NSEC3>(nsec3_rrset[0].data), domain, zone_domain);
    auto it = std::ranges::find(nsec3_rrset, owner, &RR::domain);
    return it == nsec3_rrset.end() ? nullptr : &std::get<NSEC3>(it->data);
}

const NSEC3 *find_covering_nsec3(const std::vector<RR> &nsec3_rrset, std::string_view domain,
                                 const std::string &zone_domain) {
    if (nsec3_rrset.empty()) return nullptr;
    auto owner = hashed_owner(std::get<NSEC3>(nsec3_rrset[0].data), domain, zone_domain);
    for (const auto &rr : nsec3_rrset) {
        const auto &nsec3 = std::get<NSEC3>(rr.data);
        auto next = base32hex_encode(nsec3.next_domain_hash) + "." + zone_domain;
        if (is_covered(owner, rr.domain, next)) return &nsec3;
    }
    return nullptr;
}

struct ClosestEncloser {
    std::string domain;
    bool next_closer_opt_out;
};

// RFC5155 Section 8.3.
std::optional<ClosestEncloser> prove_closest_encloser(const std::vector<RR> &nsec3_rrset, const std::string &domain,
                                                      const std::string &zone_domain) {
    if (nsec3_rrset.empty()) return std::nullopt;

    const NSEC3 *next_closer = nullptr;
    std::string_view candidate{domain};
    do {
        const auto *match = find_nsec3(nsec3_rrset, candidate, zone_domain);
        if (match != nullptr) {
            if (next_closer == nullptr) return std::nullopt;
            if (match->types.contains(RRType::DNAME)) return std::nullopt;
            if (match->types.contains(RRType::NS) && !match->types.contains(RRType::SOA)) return std::nullopt;
            return ClosestEncloser{.domain = std::string{candidate}, .next_closer_opt_out = next_closer->opt_out};
        }
        next_closer = find_covering_nsec3(nsec3_rrset, candidate, zone_domain);
    } while (pop_label(candidate));
    return std::nullopt;
}

// A wildcard expansion is valid only if the queried name itself provably does not exist (RFC4035 Section 5.3.4).
bool prove_wildcard_expansion(const std::vector<std::string_view> &labels, uint8_t rrsig_labels,
                              const std::string &owner, const dnssec::DenialRecords &denial,
                              const std::string &zone_domain) {
    if (!denial.nsec3.empty()) {
        // RFC5155 Section 8.8, the next closer name is one label below the wildcard's parent.
        return find_covering_nsec3(denial.nsec3, ancestor(labels, rrsig_labels + 1), zone_domain) != nullptr;
    }
    return any_nsec_covers(denial.nsec, owner);
}
}  // namespace

namespace dnssec {
uint16_t compute_key_tag(const std::vector<uint8_t> &data) {
    // RFC4034 Appendix B.
    uint32_t sum = 0;
    for (size_t i = 0; i < data.size(); i++) sum += (i & 1) ? data[i] : static_cast<uint32_t>(data[i]) << 8;
    sum += (sum >> 16) & 0xFFFF;
    return sum & 0xFFFF;
}

bool authenticate_rrset(const std::vector<RR> &rrset, const std::vector<RRSIG> &rrsigs,
                        const std::vector<DNSKEY> &dnskeys, const DenialRecords &denial,
                        const std::string &zone_domain) {
    if (rrset.empty()) return true;
    if (rrsigs.empty() || dnskeys.empty()) return false;

    const auto &owner = rrset[0].domain;
    auto type = rrset[0].type;
    auto labels = labels_of(owner);
    auto now = static_cast<uint32_t>(std::time(nullptr));

    for (const auto &rrsig : rrsigs) {
        if (rrsig.type_covered != type || rrsig.signer_name != zone_domain) continue;
        if (now < rrsig.inception_time || rrsig.expiration_time < now) {
            log::logger()->debug("Ignoring RRSIG outside of its validity period for {} {}", owner, type);
            continue;
        }
        if (rrsig.labels > labels.size()) continue;

        std::string signed_owner = owner;
        if (rrsig.labels < labels.size()) {
            auto is_denial = type == RRType::NSEC || type == RRType::NSEC3;
            if (!is_denial && !prove_wildcard_expansion(labels, rrsig.labels, owner, denial, zone_domain)) {
                log::logger()->debug("Wildcard expansion of {} {} is not proven", owner, type);
                continue;
            }
            signed_owner = "*." + ancestor(labels, rrsig.labels);
        }

        try {
            auto data = signed_data(rrsig, rrset, signed_owner);
            auto signature = signature_for_openssl(rrsig);
            for (const auto &dnskey : dnskeys) {
                if (dnskey.key_tag != rrsig.key_tag || dnskey.algorithm != rrsig.algorithm) continue;
                if (verify_signature(dnskey, data, signature)) return true;
            }
        } catch (const std::exception &e) {
            log::logger()->debug("RRSIG over {} {} is unusable: {}", owner, type, e.what());
        }
    }
    return false;
}

bool authenticate_delegation(const std::vector<RR> &dnskey_rrset, const std::vector<DS> &dss,
                             const std::vector<RRSIG> &rrsigs, const DenialRecords &denial,
                             const std::string &zone_domain) {
    if (dnskey_rrset.empty() || dss.empty()) return false;

    std::vector<DNSKEY> trusted;
    for (const auto &rr : dnskey_rrset) {
        if (rr.type != RRType::DNSKEY) return false;
        const auto &dnskey = std::get<DNSKEY>(rr.data);

        std::vector<uint8_t> owner;
        write_domain(owner, rr.domain);
        for (const auto &ds : dss) {
            if (ds.key_tag != dnskey.key_tag || ds.signing_algorithm != dnskey.algorithm) continue;
            try {
                auto hash = digest(ds_digest(ds.digest_algorithm),
                                   {{owner.data(), owner.size()}, {dnskey.data.data(), dnskey.data.size()}});
                if (hash == ds.digest) {
                    trusted.push_back(dnskey);
                    break;
                }
            } catch (const std::exception &e) {
                log::logger()->debug("Skipping DS {} for {}: {}", ds.key_tag, zone_domain, e.what());
            }
        }
    }
    return authenticate_rrset(dnskey_rrset, rrsigs, trusted, denial, zone_domain);
}

bool authenticate_name_error(const std::string &domain, const DenialRecords &denial, const std::string &zone_domain) {
    try {
        if (!denial.nsec3.empty()) {
            // RFC5155 Section 8.4, the wildcard at the closest encloser must not exist either.
            auto encloser = prove_closest_encloser(denial.nsec3, domain, zone_domain);
            return encloser.has_value()
                   && find_covering_nsec3(denial.nsec3, "*." + encloser->domain, zone_domain) != nullptr;
        }

        // RFC4035 Section 5.4.
        if (!any_nsec_covers(denial.nsec, domain)) return false;
        auto labels = labels_of(domain);
        auto zone_labels = labels_of(zone_domain).size();
        for (auto count = labels.size(); count > zone_labels; count--) {
            if (any_nsec_covers(denial.nsec, "*." + ancestor(labels, count - 1))) return true;
        }
    } catch (const std::exception &e) {
        log::logger()->debug("Name error proof for {} failed: {}", domain, e.what());
    }
    return false;
}

bool authenticate_no_ds(const std::string &domain, const DenialRecords &denial, const std::string &zone_domain) {
    // RFC6840 Section 4.4, an insecure delegation has NS but neither DS nor SOA.
    auto is_insecure_delegation = [](const std::unordered_set<RRType> &types) {
        return types.contains(RRType::NS) && !types.contains(RRType::DS) && !types.contains(RRType::SOA);
    };

    try {
        if (!denial.nsec3.empty()) {
            // RFC5155 Section 8.6.
            if (const auto *nsec3 = find_nsec3(denial.nsec3, domain, zone_domain)) {
                return is_insecure_delegation(nsec3->types);
            }
            auto encloser = prove_closest_encloser(denial.nsec3, domain, zone_domain);
            return encloser.has_value() && encloser->next_closer_opt_out;
        }

        const auto *nsec = find_nsec(denial.nsec, domain);
        return nsec != nullptr && is_insecure_delegation(nsec->types);
    } catch (const std::exception &e) {
        log::logger()->debug("No DS proof for {} failed: {}", domain, e.what());
        return false;
    }
}

bool authenticate_no_rrset(RRType rr_type, const std::string &domain, const DenialRecords &denial,
                           const std::string &zone_domain) {
    // RFC6840 Section 4.3, neither the type nor a CNAME may exist.
    auto lacks_type = [rr_type](const std::unordered_set<RRType> &types) {
        return !types.contains(rr_type) && !types.contains(RRType::CNAME);
    };

    try {
        if (!denial.nsec3.empty()) {
            // RFC5155 Sections 8.5 and 8.7.
            if (const auto *nsec3 = find_nsec3(denial.nsec3, domain, zone_domain)) return lacks_type(nsec3->types);

            auto encloser = prove_closest_encloser(denial.nsec3, domain, zone_domain);
            if (!encloser.has_value()) return false;
            const auto *wildcard = find_nsec3(denial.nsec3, "*." + encloser->domain, zone_domain);
            return wildcard != nullptr && lacks_type(wildcard->types);
        }

        // RFC4035 Section 5.4.
        if (const auto *nsec = find_nsec(denial.nsec, domain)) return lacks_type(nsec->types);
        return any_nsec_covers(denial.nsec, domain);
    } catch (const std::exception &e) {
        log::logger()->debug("No data proof for {} {} failed: {}", domain, rr_type, e.what());
        return false;
    }
}
}  // namespace dnssec
