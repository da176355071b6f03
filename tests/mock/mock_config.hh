#pragma once

#include <netinet/in.h>
#include <compare>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "dns.hh"

struct MockResponse {
    bool set_wrong_id{false};
    bool is_truncated{false};
    bool is_authoritative{false};
    OpCode opcode{OpCode::Query};
    bool is_response{true};
    RCode rcode{RCode::Success};
    bool copy_opt{true};
    bool set_wrong_client_cookie{false};
    bool add_server_cookie{true};

    std::vector<uint8_t> questions{};
    uint16_t questions_count{0};
    std::vector<uint8_t> answers{};
    uint16_t answers_count{0};
    std::vector<uint8_t> authority{};
    uint16_t authority_count{0};
    std::vector<uint8_t> additional{};
    uint16_t additional_count{0};
};

struct MockQuestion {
    std::string qname;
    RRType qtype;

    auto operator<=>(const MockQuestion &) const = default;
};

// Declared in each test case, answers every question missing from `mock_zone`.
extern MockResponse mock_response;
// Responses for specific questions, filled in by the test cases that serve a whole zone.
extern std::map<MockQuestion, MockResponse> mock_zone;

// The last request and its destination, the response appears to come from there.
extern std::vector<uint8_t> request_buffer;
extern struct sockaddr_in request_address;
extern int request_count;
