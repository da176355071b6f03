#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <queue>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include "dns.hh"
#include "dnssec.hh"

template <typename T, typename Variant>
inline constexpr bool IsInVariant = false;

template <typename T, typename... Ts>
inline constexpr bool IsInVariant<T, std::variant<Ts...>> = (std::same_as<T, Ts> || ...);

// https://www.cppstories.com/2021/heterogeneous-access-cpp20
struct StringHash {
    using is_transparent = void;

    size_t operator()(const char *str) const { return std::hash<std::string_view>{}(str); }
    size_t operator()(std::string_view str) const { return std::hash<std::string_view>{}(str); }
    size_t operator()(const std::string &str) const { return std::hash<std::string>{}(str); }
};

struct Zone;
struct Nameserver;

enum class FeatureState { Disable, Enable, Require };

enum class ResolveErrorKind { Timeout, NxDomain, ResolutionError, DnssecValidationError };

class ResolveError : public std::runtime_error {
public:
    ResolveError(ResolveErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

    ResolveErrorKind kind() const { return kind_; }

private:
    ResolveErrorKind kind_;
};

// A nameserver to start from. Without a zone and a DS or DNSKEY trust anchor its answers are never authenticated.
struct NameserverConfig {
    std::string address;
    std::optional<std::string> zone_domain{std::nullopt};
    std::vector<DS> dss{};
    std::vector<DNSKEY> dnskeys{};
};

struct ResolverConfig {
    std::chrono::milliseconds timeout{5000};
    std::optional<NameserverConfig> nameserver{std::nullopt};
    bool use_root_nameservers{true};
    uint16_t port{DNS_PORT};
    bool enable_rd{true};
    FeatureState cookies{FeatureState::Enable};
};

// Iterative resolver which validates the whole DNSSEC chain itself and only returns authenticated RRsets.
// Not thread-safe, one instance serves one lookup at a time.
class Resolver {
public:
    explicit Resolver(const ResolverConfig &config = {});
    ~Resolver();

    Resolver(const Resolver &) = delete;
    Resolver &operator=(const Resolver &) = delete;

    // Returns the authenticated RRset, empty for an authenticated NODATA. Throws ResolveError.
    std::vector<RR> resolve(const std::string &domain, RRType rr_type);

private:
    struct Answer {
        std::vector<RR> rrset;
        bool name_error{false};
        bool authenticated{false};
    };

    // List of zones to ask when there is no information to guide zone selection.
    class SafetyBelt {
    public:
        explicit SafetyBelt(const std::queue<std::shared_ptr<Zone>> &zones) : zones(zones) {}

        std::shared_ptr<Zone> next();

    private:
        std::queue<std::shared_ptr<Zone>> zones;
    };

    // Remembers why nameservers failed so that the final error reports the most relevant kind.
    class FailureTracker {
    public:
        void record(ResolveErrorKind kind, const std::string &message);
        [[noreturn]] void raise(const std::string &sname) const;

    private:
        bool bogus{false};
        bool other{false};
        bool timed_out{false};
        std::string last_message{"No nameserver to ask"};
    };

    std::chrono::milliseconds query_timeout, udp_timeout;
    uint16_t port;
    bool enable_rd;
    FeatureState cookies;
    const std::queue<std::shared_ptr<Zone>> safety_belt_zones;
    std::default_random_engine rng;
    int fd;
    std::unordered_map<std::string, std::shared_ptr<Zone>, StringHash, std::equal_to<>> zones;
    std::chrono::steady_clock::time_point query_start;

    std::queue<std::shared_ptr<Zone>> init_safety_belt(const ResolverConfig &config) const;

    std::shared_ptr<Zone> new_zone(const std::string &domain, bool is_secure) const;
    std::shared_ptr<Zone> new_root_zone() const;
    std::shared_ptr<Zone> new_zone_from_config(const NameserverConfig &config) const;
    std::shared_ptr<Zone> find_zone(std::string_view domain) const;
    void load_dnskeys(const std::shared_ptr<Zone> &zone, int depth);
    std::shared_ptr<Zone> enter_missing_zone(const Zone &zone, const std::string &domain, const std::string &sname,
                                             int depth);

    void set_socket_timeout(std::chrono::milliseconds timeout) const;
    void update_timeout();

    void udp_send(const std::vector<uint8_t> &buffer, struct sockaddr_in address);
    void udp_receive(std::vector<uint8_t> &buffer, struct sockaddr_in address);
    Response exchange(Zone &zone, Nameserver &nameserver, const std::string &sname, RRType qtype, int depth);

    static std::vector<RR> take_unauthenticated(std::vector<RR> &rrs, RRType rr_type);
    static std::vector<RR> take_unauthenticated(std::vector<RR> &rrs, RRType rr_type, const std::string &domain);
    bool authenticate_rrset(const std::vector<RR> &rrset, RRType rr_type, const std::vector<RRSIG> &rrsigs,
                            const dnssec::DenialRecords &denial, const Zone &zone) const;
    std::vector<RR> take_rrsets(std::vector<RR> &rrs, RRType rr_type, const dnssec::DenialRecords &denial,
                                const Zone &zone) const;
    std::vector<RR> take_rrset(std::vector<RR> &rrs, RRType rr_type, const std::string &domain,
                               const dnssec::DenialRecords &denial, const Zone &zone) const;

    template <typename T>
        requires IsInVariant<T, decltype(RR::data)>
    static std::vector<T> rrset_to_data(std::vector<RR> &&rrset) {
        std::vector<T> result;
        result.reserve(rrset.size());
        for (auto &rr : rrset) result.push_back(std::move(std::get<T>(rr.data)));
        return result;
    }

    Answer resolve_rec(const std::string &domain, RRType rr_type, int depth,
                       std::shared_ptr<Zone> search_zone = nullptr);
};

// Converts a domain to lowercase and fully qualifies it. Throws std::runtime_error on invalid names.
std::string fully_qualify_domain(const std::string &domain);
