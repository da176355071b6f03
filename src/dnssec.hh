#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "dns.hh"

namespace dnssec {
// Authenticated NSEC and NSEC3 RRs collected from a response, used for denial-of-existence and wildcard proofs.
struct DenialRecords {
    std::vector<RR> nsec;
    std::vector<RR> nsec3;

    bool empty() const { return nsec.empty() && nsec3.empty(); }
};

uint16_t compute_key_tag(const std::vector<uint8_t> &data);

// Verifies that at least one RRSIG made by one of `dnskeys` covers the whole RRset.
bool authenticate_rrset(const std::vector<RR> &rrset, const std::vector<RRSIG> &rrsigs,
                        const std::vector<DNSKEY> &dnskeys, const DenialRecords &denial,
                        const std::string &zone_domain);
// Verifies a DNSKEY RRset against the parent's DS RRs, the RRset must be self-signed by a key matching a DS.
bool authenticate_delegation(const std::vector<RR> &dnskey_rrset, const std::vector<DS> &dss,
                             const std::vector<RRSIG> &rrsigs, const DenialRecords &denial,
                             const std::string &zone_domain);

bool authenticate_name_error(const std::string &domain, const DenialRecords &denial, const std::string &zone_domain);
bool authenticate_no_ds(const std::string &domain, const DenialRecords &denial, const std::string &zone_domain);
bool authenticate_no_rrset(RRType rr_type, const std::string &domain, const DenialRecords &denial,
                           const std::string &zone_domain);
}  // namespace dnssec
