#include "resolve.hh"
#include <arpa/inet.h>
#include <fmt/format.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <queue>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include "dns.hh"
#include "dnssec.hh"
#include "log.hh"

struct Nameserver {
    std::variant<in_addr_t, std::string> address;
    std::optional<uint16_t> udp_payload_size{std::nullopt};
    bool sent_bad_cookie{false};
    DNSCookies cookies{};

    explicit Nameserver(in_addr_t address) : address(address) {}
    explicit Nameserver(std::string domain) : address(std::move(domain)) {}
};

struct Zone {
    std::string domain;
    // The chain of trust reaches this zone, so every RRset it serves must be signed.
    bool is_secure;
    bool enable_edns{true};
    bool enable_cookies;
    bool is_being_resolved{false};
    std::vector<std::shared_ptr<Nameserver>> nameservers;
    std::vector<DS> dss;
    std::vector<DNSKEY> dnskeys;

    Zone(std::string domain, bool is_secure, bool enable_cookies)
        : domain(std::move(domain)), is_secure(is_secure), enable_cookies(enable_cookies) {}

    template <typename T>
    void add_nameserver(T &&address) {
        nameservers.push_back(std::make_shared<Nameserver>(std::forward<T>(address)));
    }
};

namespace {
namespace log = forsale::log;

const constexpr std::chrono::milliseconds MIN_QUERY_TIMEOUT{300};
const constexpr int MAX_QUERY_DEPTH = 20;

// https://www.iana.org/domains/root/servers
const char *const ROOT_IP[] = {
    "198.41.0.4",    "170.247.170.2", "192.33.4.12",   "199.7.91.13",  "192.203.230.10", "192.5.5.241",  "192.112.36.4",
    "198.97.190.53", "192.36.148.17", "192.58.128.30", "193.0.14.129", "199.7.83.42",    "202.12.27.33",
};

// https://data.iana.org/root-anchors/root-anchors.xml
const DS ROOT_DS[] = {
    {
        .key_tag = 20326,
        .signing_algorithm = SigningAlgorithm::RSASHA256,
        .digest_algorithm = DigestAlgorithm::SHA256,
        .digest = {0xE0, 0x6D, 0x44, 0xB8, 0x0B, 0x8F, 0x1D, 0x39, 0xA9, 0x5C, 0x0B, 0x0D, 0x7C, 0x65, 0xD0, 0x84,
                   0x58, 0xE8, 0x80, 0x40, 0x9B, 0xBC, 0x68, 0x34, 0x57, 0x10, 0x42, 0x37, 0xC7, 0xF8, 0xEC, 0x8D},
        .data = {},
    },
    {
        .key_tag = 38696,
        .signing_algorithm = SigningAlgorithm::RSASHA256,
        .digest_algorithm = DigestAlgorithm::SHA256,
        .digest = {0x68, 0x3D, 0x2D, 0x0A, 0xCB, 0x8C, 0x9B, 0x71, 0x2A, 0x19, 0x48, 0xB2, 0x7F, 0x74, 0x12, 0x19,
                   0x29, 0x8D, 0x0A, 0x45, 0x0D, 0x61, 0x2C, 0x48, 0x3A, 0xF4, 0x44, 0xA4, 0xC0, 0xFB, 0x2B, 0x16},
        .data = {},
    },
};

// The deadline of the whole query, unlike a single nameserver timing out it is never retried.
struct query_timeout_error : public std::runtime_error {
    query_timeout_error() : std::runtime_error("Query timed out") {}
};

struct bad_cookie_error : public std::runtime_error {
    bad_cookie_error() : std::runtime_error("Bad server cookie") {}
};

// The answer is signed by a zone below the one asked, because the nameserver serves both.
struct missing_referral_error : public std::runtime_error {
    std::string zone;

    explicit missing_referral_error(std::string zone) : std::runtime_error("Missing referral"), zone(std::move(zone)) {}
};

// Marks a zone as unusable while its own data is being resolved to avoid infinite recursion.
class ResolvingGuard {
public:
    explicit ResolvingGuard(Zone &zone) : zone(zone), previous(std::exchange(zone.is_being_resolved, true)) {}
    ~ResolvingGuard() { zone.is_being_resolved = previous; }

    ResolvingGuard(const ResolvingGuard &) = delete;
    ResolvingGuard &operator=(const ResolvingGuard &) = delete;

private:
    Zone &zone;
    bool previous;
};

size_t count_labels(std::string_view domain) {
    return domain == "." ? 0 : static_cast<size_t>(std::ranges::count(domain, '.'));
}

bool is_subdomain(std::string_view domain, std::string_view zone) {
    if (zone == ".") return true;
    if (!domain.ends_with(zone)) return false;
    return domain.length() == zone.length() || domain[domain.length() - zone.length() - 1] == '.';
}

// A zone is closer if it is an ancestor of the search name below the current zone.
bool is_zone_closer(const std::string &sname, const std::string &old_zone, const std::string &new_zone) {
    return is_subdomain(sname, new_zone) && count_labels(new_zone) > count_labels(old_zone);
}

bool address_equals(struct sockaddr_in a, struct sockaddr_in b) {
    return a.sin_port == b.sin_port && a.sin_addr.s_addr == b.sin_addr.s_addr;
}

std::string address_to_string(struct in_addr address) {
    char str[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &address, str, sizeof(str)) == nullptr) return "invalid address";
    return str;
}

template <typename Predicate>
std::vector<RR> take_if(std::vector<RR> &rrs, Predicate predicate) {
    auto split = std::stable_partition(rrs.begin(), rrs.end(), [&](const RR &rr) { return !predicate(rr); });
    std::vector<RR> taken{std::make_move_iterator(split), std::make_move_iterator(rrs.end())};
    rrs.erase(split, rrs.end());
    return taken;
}

void log_section(const char *name, const std::vector<RR> &rrs) {
    for (const auto &rr : rrs) log::logger()->debug("{}: {}", name, rr);
}
}  // namespace

std::string fully_qualify_domain(const std::string &domain) {
    if (domain.empty()) throw std::runtime_error("Domain is empty");
    if (domain == ".") return domain;

    std::string fqd;
    fqd.reserve(domain.length() + 1);
    size_t label_start = 0;
    for (size_t i = 0; i < domain.length(); i++) {
        if (domain[i] == '.') {
            if (i == label_start) throw std::runtime_error("Domain has an empty label");
            if (i - label_start > MAX_LABEL_LENGTH) throw std::runtime_error("Label is too long");
            label_start = i + 1;
        }
        fqd.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(domain[i]))));
    }
    if (domain.length() - label_start > MAX_LABEL_LENGTH) throw std::runtime_error("Label is too long");
    if (!fqd.ends_with('.')) fqd.push_back('.');

    if (fqd.length() > MAX_DOMAIN_LENGTH) throw std::runtime_error("Domain is too long");
    return fqd;
}

Resolver::Resolver(const ResolverConfig &config)
    : query_timeout(std::max(config.timeout, MIN_QUERY_TIMEOUT)),
      udp_timeout(query_timeout / 3),
      port(config.port),
      enable_rd(config.enable_rd),
      cookies(config.cookies),
      safety_belt_zones(init_safety_belt(config)),
      rng(std::random_device{}()) {
    if (config.use_root_nameservers) {
        // While the root NS RRset is signed, the addresses in root-servers.net are not.
        auto root_servers_zone = new_zone("root-servers.net.", false);
        for (const auto *ip : ROOT_IP) {
            in_addr_t address;
            if (inet_pton(AF_INET, ip, &address) != 1) throw std::runtime_error("Failed to add root nameservers");
            root_servers_zone->add_nameserver(address);
        }
        zones[root_servers_zone->domain] = root_servers_zone;
    }

    fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd == -1) throw std::runtime_error("Failed to create UDP socket");
}

Resolver::~Resolver() { close(fd); }

std::vector<RR> Resolver::resolve(const std::string &domain, RRType rr_type) {
    if (rr_type == RRType::RRSIG || rr_type == RRType::OPT) {
        throw ResolveError(ResolveErrorKind::ResolutionError, fmt::format("{} cannot be queried", rr_type));
    }

    std::string qname;
    try {
        qname = fully_qualify_domain(domain);
    } catch (const std::exception &e) {
        throw ResolveError(ResolveErrorKind::ResolutionError,
                           fmt::format("Invalid domain \"{}\": {}", domain, e.what()));
    }

    Answer answer;
    try {
        query_start = std::chrono::steady_clock::now();
        set_socket_timeout(udp_timeout);
        answer = resolve_rec(qname, rr_type, 0);
    } catch (const query_timeout_error &) {
        throw ResolveError(ResolveErrorKind::Timeout, fmt::format("Resolving {} {} timed out", qname, rr_type));
    } catch (const ResolveError &) {
        throw;
    } catch (const std::exception &e) {
        throw ResolveError(ResolveErrorKind::ResolutionError, e.what());
    }

    if (!answer.authenticated) {
        throw ResolveError(ResolveErrorKind::DnssecValidationError,
                           fmt::format("Answer for {} {} is not authenticated by DNSSEC", qname, rr_type));
    }
    if (answer.name_error) throw ResolveError(ResolveErrorKind::NxDomain, fmt::format("{} does not exist", qname));
    return std::move(answer.rrset);
}

std::shared_ptr<Zone> Resolver::SafetyBelt::next() {
    while (!zones.empty()) {
        auto zone = std::move(zones.front());
        zones.pop();
        if (zone != nullptr && !zone->is_being_resolved) return zone;
    }
    return nullptr;
}

void Resolver::FailureTracker::record(ResolveErrorKind kind, const std::string &message) {
    switch (kind) {
        case ResolveErrorKind::DnssecValidationError: bogus = true; break;
        case ResolveErrorKind::Timeout:               timed_out = true; break;
        default:                                      other = true; break;
    }
    last_message = message;
}

void Resolver::FailureTracker::raise(const std::string &sname) const {
    auto message = fmt::format("Failed to resolve {}: {}", sname, last_message);
    if (bogus) throw ResolveError(ResolveErrorKind::DnssecValidationError, message);
    if (timed_out && !other) throw ResolveError(ResolveErrorKind::Timeout, message);
    throw ResolveError(ResolveErrorKind::ResolutionError, message);
}

std::queue<std::shared_ptr<Zone>> Resolver::init_safety_belt(const ResolverConfig &config) const {
    std::queue<std::shared_ptr<Zone>> safety_belt;
    if (config.nameserver.has_value()) safety_belt.push(new_zone_from_config(*config.nameserver));
    if (config.use_root_nameservers) safety_belt.push(new_root_zone());

    if (safety_belt.empty()) throw std::runtime_error("No nameserver is specified");
    return safety_belt;
}

std::shared_ptr<Zone> Resolver::new_zone(const std::string &domain, bool is_secure) const {
    return std::make_shared<Zone>(domain, is_secure, cookies != FeatureState::Disable);
}

std::shared_ptr<Zone> Resolver::new_root_zone() const {
    auto zone = new_zone(".", true);
    for (const auto *ip : ROOT_IP) {
        in_addr_t address;
        if (inet_pton(AF_INET, ip, &address) != 1) throw std::runtime_error("Failed to add root nameservers");
        zone->add_nameserver(address);
    }
    zone->dss.assign(std::begin(ROOT_DS), std::end(ROOT_DS));
    return zone;
}

std::shared_ptr<Zone> Resolver::new_zone_from_config(const NameserverConfig &config) const {
    auto has_trust_anchor = config.zone_domain.has_value() && (!config.dss.empty() || !config.dnskeys.empty());
    auto zone = new_zone(config.zone_domain.has_value() ? fully_qualify_domain(*config.zone_domain) : ".",
                         has_trust_anchor);
    zone->dss = config.dss;
    zone->dnskeys = config.dnskeys;

    in_addr_t address;
    if (inet_pton(AF_INET, config.address.c_str(), &address) == 1) {
        zone->add_nameserver(address);
    } else {
        zone->add_nameserver(fully_qualify_domain(config.address));
    }
    return zone;
}

std::shared_ptr<Zone> Resolver::find_zone(std::string_view domain) const {
    for (;;) {
        auto it = zones.find(domain);
        if (it != zones.cend() && !it->second->is_being_resolved) return it->second;
        if (!pop_label(domain)) return nullptr;
    }
}

void Resolver::load_dnskeys(const std::shared_ptr<Zone> &zone, int depth) {
    Answer answer;
    {
        ResolvingGuard guard{*zone};
        answer = resolve_rec(zone->domain, RRType::DNSKEY, depth + 1, zone);
    }

    if (answer.name_error || answer.rrset.empty() || !answer.authenticated) {
        throw ResolveError(ResolveErrorKind::DnssecValidationError,
                           fmt::format("Failed to obtain authenticated DNSKEYs of {}", zone->domain));
    }
    zone->dnskeys = rrset_to_data<DNSKEY>(std::move(answer.rrset));
}

std::shared_ptr<Zone> Resolver::enter_missing_zone(const Zone &zone, const std::string &domain,
                                                   const std::string &sname, int depth) {
    if (!is_zone_closer(sname, zone.domain, domain)) {
        throw ResolveError(ResolveErrorKind::DnssecValidationError,
                           fmt::format("Signer {} is not an ancestor of {} below {}", domain, sname, zone.domain));
    }
    if (auto it = zones.find(domain); it != zones.end()) return it->second;

    // The nameservers are authoritative for both zones, otherwise they would have sent a referral.
    auto missing_zone = new_zone(domain, false);
    missing_zone->nameservers = zone.nameservers;
    if (zone.is_secure) {
        auto ds = resolve_rec(domain, RRType::DS, depth + 1);
        if (!ds.authenticated || ds.name_error) {
            throw ResolveError(ResolveErrorKind::DnssecValidationError,
                               fmt::format("Failed to authenticate the delegation to {}", domain));
        }
        if (!ds.rrset.empty()) {
            missing_zone->dss = rrset_to_data<DS>(std::move(ds.rrset));
            missing_zone->is_secure = true;
        }
    }

    zones[domain] = missing_zone;
    return missing_zone;
}

void Resolver::set_socket_timeout(std::chrono::milliseconds timeout) const {
    struct timeval tv;
    tv.tv_sec = timeout.count() / 1000;
    tv.tv_usec = (timeout.count() % 1000) * 1000;

    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0
        || setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        throw std::runtime_error("Failed to set socket timeout");
    }
}

void Resolver::update_timeout() {
    using namespace std::chrono;

    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - query_start);
    if (elapsed >= query_timeout) throw query_timeout_error();

    auto time_left = query_timeout - elapsed;
    if (time_left < udp_timeout) set_socket_timeout(time_left);
}

void Resolver::udp_send(const std::vector<uint8_t> &buffer, struct sockaddr_in address) {
    auto *socket_address = reinterpret_cast<struct sockaddr *>(&address);
    auto result = sendto(fd, buffer.data(), buffer.size(), 0, socket_address, sizeof(address));
    auto error = errno;
    update_timeout();
    if (result == -1 && (error == EAGAIN || error == EWOULDBLOCK)) {
        throw ResolveError(ResolveErrorKind::Timeout, "Request timed out");
    }
    if (result != static_cast<ssize_t>(buffer.size())) throw std::runtime_error("Failed to send the request");
}

void Resolver::udp_receive(std::vector<uint8_t> &buffer, struct sockaddr_in request_address) {
    struct sockaddr_in address;
    auto *socket_address = reinterpret_cast<struct sockaddr *>(&address);
    socklen_t address_length;
    ssize_t result;
    // Skip datagrams which do not come from the address and port the request was sent to.
    do {
        address_length = sizeof(address);
        result = recvfrom(fd, buffer.data(), buffer.size(), 0, socket_address, &address_length);
        auto error = errno;
        update_timeout();
        if (result == -1) {
            if (error == EAGAIN || error == EWOULDBLOCK) {
                throw ResolveError(ResolveErrorKind::Timeout, "Response timed out");
            }
            throw std::runtime_error("Failed to receive the response");
        }
    } while (address_length != sizeof(address) || !address_equals(address, request_address));
    buffer.resize(result);
}

Response Resolver::exchange(Zone &zone, Nameserver &nameserver, const std::string &sname, RRType qtype, int depth) {
    if (std::holds_alternative<std::string>(nameserver.address)) {
        auto nameserver_domain = std::get<std::string>(nameserver.address);

        Answer answer;
        {
            ResolvingGuard guard{zone};
            answer = resolve_rec(nameserver_domain, RRType::A, depth + 1);
        }
        if (answer.name_error || answer.rrset.empty()) {
            throw std::runtime_error(fmt::format("Failed to get the address of {}", nameserver_domain));
        }

        auto addresses = rrset_to_data<A>(std::move(answer.rrset));
        std::ranges::shuffle(addresses, rng);
        nameserver.address = addresses[0].address;
        for (size_t i = 1; i < addresses.size(); i++) zone.add_nameserver(addresses[i].address);
    }

    struct sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    address.sin_addr.s_addr = std::get<in_addr_t>(nameserver.address);
    log::logger()->debug("Resolving {} {} using {} ({})", sname, qtype, address_to_string(address.sin_addr),
                         zone.domain);

    auto payload_size
        = nameserver.udp_payload_size.value_or(zone.enable_edns ? EDNS_UDP_PAYLOAD_SIZE : STANDARD_UDP_PAYLOAD_SIZE);
    RequestOptions options{
        .payload_size = payload_size,
        .enable_rd = enable_rd,
        .enable_edns = zone.enable_edns,
        .enable_dnssec = zone.enable_edns,
        .enable_cookies = zone.enable_edns && zone.enable_cookies,
    };

    std::vector<uint8_t> buffer;
    buffer.reserve(payload_size);
    auto id = write_request(buffer, options, sname, qtype, nameserver.cookies);
    udp_send(buffer, address);
    buffer.resize(payload_size);
    udp_receive(buffer, address);
    auto response = read_response(buffer, id, sname, qtype);

    if (zone.enable_edns) {
        auto opt_rrset = take_unauthenticated(response.additional, RRType::OPT);
        if (opt_rrset.size() > 1) throw std::runtime_error("Response has multiple OPT RRs");

        if (opt_rrset.empty()) {
            if (zone.is_secure) {
                throw ResolveError(ResolveErrorKind::DnssecValidationError, "Nameserver does not support EDNS");
            }
            zone.enable_edns = false;
        } else {
            auto &opt = std::get<OPT>(opt_rrset[0].data);
            response.rcode = static_cast<RCode>((static_cast<uint16_t>(opt.upper_extended_rcode) << 4)
                                                | std::to_underlying(response.rcode));
            nameserver.udp_payload_size
                = std::clamp(opt.udp_payload_size, STANDARD_UDP_PAYLOAD_SIZE, EDNS_UDP_PAYLOAD_SIZE);

            if (!opt.dnssec_ok && zone.is_secure) {
                throw ResolveError(ResolveErrorKind::DnssecValidationError, "Nameserver does not support DNSSEC");
            }

            if (zone.enable_cookies) {
                if (opt.cookies.has_value()) {
                    if (opt.cookies->client != nameserver.cookies.client) {
                        throw std::runtime_error("Wrong client cookie");
                    }
                    nameserver.cookies.server = std::move(opt.cookies->server);
                } else {
                    if (cookies == FeatureState::Require) {
                        throw std::runtime_error("Nameserver does not support cookies");
                    }
                    zone.enable_cookies = false;
                }
            }
        }
    }

    if (log::logger()->should_log(spdlog::level::debug)) {
        log_section("answer", response.answers);
        log_section("authority", response.authority);
        log_section("additional", response.additional);
    }
    return response;
}

std::vector<RR> Resolver::take_unauthenticated(std::vector<RR> &rrs, RRType rr_type) {
    return take_if(rrs, [rr_type](const RR &rr) { return rr.type == rr_type; });
}

std::vector<RR> Resolver::take_unauthenticated(std::vector<RR> &rrs, RRType rr_type, const std::string &domain) {
    return take_if(rrs, [&](const RR &rr) { return rr.type == rr_type && rr.domain == domain; });
}

bool Resolver::authenticate_rrset(const std::vector<RR> &rrset, RRType rr_type, const std::vector<RRSIG> &rrsigs,
                                  const dnssec::DenialRecords &denial, const Zone &zone) const {
    if (rrset.empty()) return true;
    if (rrsigs.empty()) return false;

    // A nameserver authoritative for both a zone and its child answers for the child without a referral.
    if (rrsigs[0].signer_name != zone.domain) throw missing_referral_error(rrsigs[0].signer_name);

    if (rr_type == RRType::DNSKEY && zone.dnskeys.empty()) {
        return dnssec::authenticate_delegation(rrset, zone.dss, rrsigs, denial, zone.domain);
    }
    return dnssec::authenticate_rrset(rrset, rrsigs, zone.dnskeys, denial, zone.domain);
}

std::vector<RR> Resolver::take_rrset(std::vector<RR> &rrs, RRType rr_type, const std::string &domain,
                                     const dnssec::DenialRecords &denial, const Zone &zone) const {
    auto rrset = take_if(rrs, [&](const RR &rr) { return rr.type == rr_type && rr.domain == domain; });
    auto rrsig_rrs = take_if(rrs, [&](const RR &rr) {
        return rr.type == RRType::RRSIG && rr.domain == domain && std::get<RRSIG>(rr.data).type_covered == rr_type;
    });

    auto rrsigs = rrset_to_data<RRSIG>(std::move(rrsig_rrs));
    if (zone.is_secure && !authenticate_rrset(rrset, rr_type, rrsigs, denial, zone)) {
        throw ResolveError(ResolveErrorKind::DnssecValidationError,
                           fmt::format("Failed to authenticate {} {} in {}", domain, rr_type, zone.domain));
    }
    return rrset;
}

std::vector<RR> Resolver::take_rrsets(std::vector<RR> &rrs, RRType rr_type, const dnssec::DenialRecords &denial,
                                      const Zone &zone) const {
    std::vector<std::string> owners;
    for (const auto &rr : rrs) {
        if (rr.type == rr_type && std::ranges::find(owners, rr.domain) == owners.end()) owners.push_back(rr.domain);
    }

    std::vector<RR> result;
    for (const auto &owner : owners) {
        auto rrset = take_rrset(rrs, rr_type, owner, denial, zone);
        result.insert(result.end(), std::make_move_iterator(rrset.begin()), std::make_move_iterator(rrset.end()));
    }
    return result;
}

Resolver::Answer Resolver::resolve_rec(const std::string &qname, RRType qtype, int depth,
                                       std::shared_ptr<Zone> search_zone) {
    if (depth >= MAX_QUERY_DEPTH) throw ResolveError(ResolveErrorKind::ResolutionError, "Query is too deep");

    std::string sname{qname};
    SafetyBelt safety_belt{safety_belt_zones};
    FailureTracker failures;

    std::shared_ptr<Zone> next_zone = std::move(search_zone);
    if (next_zone == nullptr) {
        std::string_view start{sname};
        // DS RRs are served by the parent side of a delegation (RFC4034).
        if (qtype == RRType::DS) pop_label(start);
        next_zone = find_zone(start);
        if (next_zone == nullptr) next_zone = safety_belt.next();
    }

    while (next_zone != nullptr) {
        auto zone = std::move(next_zone);
        next_zone = nullptr;

        if (zone->is_secure && zone->dnskeys.empty() && !zone->is_being_resolved) load_dnskeys(zone, depth);

        std::optional<std::string> missing_zone;
        std::ranges::shuffle(zone->nameservers, rng);
        for (size_t i = 0; i < zone->nameservers.size(); i++) {
            auto nameserver = zone->nameservers[i];
            try {
                auto response = exchange(*zone, *nameserver, sname, qtype, depth);

                // Collected first since wildcard answers are proven with them.
                dnssec::DenialRecords denial;
                denial.nsec3 = take_rrsets(response.authority, RRType::NSEC3, {}, *zone);
                denial.nsec = take_rrsets(response.authority, RRType::NSEC, {}, *zone);

                switch (response.rcode) {
                    case RCode::Success: break;
                    case RCode::NameError:
                        if (zone->is_secure) {
                            if (!dnssec::authenticate_name_error(sname, denial, zone->domain)) {
                                throw ResolveError(ResolveErrorKind::DnssecValidationError,
                                                   fmt::format("Failed to authenticate that {} does not exist", sname));
                            }
                            return Answer{.rrset = {}, .name_error = true, .authenticated = true};
                        }
                        if (!response.is_authoritative) {
                            throw std::runtime_error("Non-authoritative nameserver cannot deny the existence");
                        }
                        return Answer{.rrset = {}, .name_error = true, .authenticated = false};
                    case RCode::BadCookie:      throw bad_cookie_error();
                    case RCode::FormatError:    throw std::runtime_error("Nameserver is unable to interpret the query");
                    case RCode::ServerError:    throw std::runtime_error("Nameserver failure");
                    case RCode::NotImplemented: throw std::runtime_error("Nameserver does not support this query");
                    case RCode::Refused:        throw std::runtime_error("Nameserver refused to answer");
                    case RCode::BadVersion:     throw std::runtime_error("Nameserver does not support EDNS version");
                    default:                    throw std::runtime_error("Unknown response code");
                }

                // Follow the CNAMEs before looking for the answer.
                std::vector<std::string> followed_cnames;
                auto cname_rrset = take_rrsets(response.answers, RRType::CNAME, denial, *zone);
                for (;;) {
                    if (std::ranges::find(followed_cnames, sname) != followed_cnames.end()) {
                        throw ResolveError(ResolveErrorKind::ResolutionError, "CNAME loop");
                    }

                    auto cname_rr = std::ranges::find(cname_rrset, sname, &RR::domain);
                    if (cname_rr == cname_rrset.end()) break;
                    if (qtype == RRType::CNAME) {
                        return Answer{.rrset = {std::move(*cname_rr)}, .authenticated = zone->is_secure};
                    }

                    followed_cnames.push_back(sname);
                    sname = std::get<CNAME>(cname_rr->data).domain;
                }

                auto result = take_rrset(response.answers, qtype, sname, denial, *zone);
                if (!result.empty()) return Answer{.rrset = std::move(result), .authenticated = zone->is_secure};

                // Look for the referral.
                std::shared_ptr<Zone> referral_zone;
                for (auto &ns_rr : take_unauthenticated(response.authority, RRType::NS)) {
                    if (referral_zone == nullptr) {
                        if (!is_zone_closer(sname, zone->domain, ns_rr.domain)) break;
                        referral_zone = new_zone(ns_rr.domain, false);
                    } else if (ns_rr.domain != referral_zone->domain) {
                        throw std::runtime_error(fmt::format("Authority contains multiple referrals: {} and {}",
                                                             ns_rr.domain, referral_zone->domain));
                    }

                    auto &ns_domain = std::get<NS>(ns_rr.data).domain;
                    auto glue = rrset_to_data<A>(take_unauthenticated(response.additional, RRType::A, ns_domain));
                    if (glue.empty()) {
                        referral_zone->add_nameserver(std::move(ns_domain));
                    } else {
                        for (const auto &a : glue) referral_zone->add_nameserver(a.address);
                    }
                }

                if (referral_zone != nullptr) {
                    // A secure parent must prove either the child's DS RRset or an insecure delegation.
                    if (zone->is_secure) {
                        auto ds_rrset
                            = take_rrset(response.authority, RRType::DS, referral_zone->domain, denial, *zone);
                        if (!ds_rrset.empty()) {
                            referral_zone->dss = rrset_to_data<DS>(std::move(ds_rrset));
                            referral_zone->is_secure = true;
                        } else if (!dnssec::authenticate_no_ds(referral_zone->domain, denial, zone->domain)) {
                            throw ResolveError(ResolveErrorKind::DnssecValidationError,
                                               fmt::format("Failed to authenticate the delegation to {}",
                                                           referral_zone->domain));
                        }
                    }

                    zones[referral_zone->domain] = referral_zone;
                    next_zone = std::move(referral_zone);
                    break;
                }

                if (!followed_cnames.empty()) {
                    // The CNAME target lives elsewhere, restart the search from the closest known zone.
                    auto answer = resolve_rec(sname, qtype, depth + 1);
                    answer.authenticated = answer.authenticated && zone->is_secure;
                    return answer;
                }

                if (zone->is_secure && qtype != RRType::DNSKEY) {
                    if (!dnssec::authenticate_no_rrset(qtype, sname, denial, zone->domain)) {
                        throw ResolveError(ResolveErrorKind::DnssecValidationError,
                                           fmt::format("Failed to authenticate that {} has no {}", sname, qtype));
                    }
                    return Answer{.rrset = {}, .name_error = false, .authenticated = true};
                }

                // No referral and no answer from an authoritative nameserver indicate No Data.
                if (response.is_authoritative) return Answer{};

                next_zone = safety_belt.next();
                if (next_zone == nullptr) {
                    throw ResolveError(ResolveErrorKind::ResolutionError,
                                       fmt::format("No nameserver is authoritative for {}", sname));
                }
                break;
            } catch (const query_timeout_error &) {
                throw;
            } catch (const bad_cookie_error &e) {
                failures.record(ResolveErrorKind::ResolutionError, e.what());
                if (!nameserver->sent_bad_cookie) {
                    // Retry the same nameserver once with the new server cookie.
                    nameserver->sent_bad_cookie = true;
                    i--;
                }
            } catch (const missing_referral_error &e) {
                missing_zone = e.zone;
                break;
            } catch (const ResolveError &e) {
                log::logger()->debug("Nameserver of {} failed to resolve {}: {}", zone->domain, sname, e.what());
                failures.record(e.kind(), e.what());
            } catch (const std::exception &e) {
                log::logger()->debug("Nameserver of {} failed to resolve {}: {}", zone->domain, sname, e.what());
                failures.record(ResolveErrorKind::ResolutionError, e.what());
            }
        }

        if (missing_zone.has_value()) {
            next_zone = enter_missing_zone(*zone, *missing_zone, sname, depth);
            continue;
        }
        if (next_zone == nullptr) failures.raise(sname);
    }
    failures.raise(sname);
}
