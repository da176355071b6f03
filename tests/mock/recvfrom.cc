#include <arpa/inet.h>
#include <sys/socket.h>
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <iterator>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "dns.hh"
#include "mock_config.hh"
#include "write.hh"

std::map<MockQuestion, MockResponse> mock_zone;

namespace {
const constexpr size_t HEADER_SIZE = 12;

// Offsets inside the OPT RR written by the resolver: owner, type, class, ttl, rdlength, then the COOKIE option.
const constexpr size_t OPT_EXTENDED_RCODE = 5;
const constexpr size_t OPT_DATA_LENGTH = 9;
const constexpr size_t OPT_OPTION_CODE = 11;
const constexpr size_t OPT_OPTION_LENGTH = 13;
const constexpr size_t OPT_CLIENT_COOKIE = 15;
const constexpr size_t CLIENT_COOKIE_SIZE = 8;

const constexpr uint8_t SERVER_COOKIE[] = {0x5E, 0x7A, 0x11, 0x3C, 0x90, 0x02, 0xBD, 0x48};

struct MockRequest {
    uint16_t id;
    uint16_t question_count;
    MockQuestion question;
    std::vector<uint8_t> question_wire;
    std::vector<uint8_t> opt;
};

uint16_t u16_at(const std::vector<uint8_t> &buffer, size_t offset) {
    assert(offset + 2 <= buffer.size());
    return static_cast<uint16_t>((buffer[offset] << 8) | buffer[offset + 1]);
}

void set_u16_at(std::vector<uint8_t> &buffer, size_t offset, uint16_t value) {
    buffer[offset] = value >> 8;
    buffer[offset + 1] = value & 0xFF;
}

// The resolver writes one uncompressed question, optionally followed by its OPT RR.
MockRequest parse_request(const std::vector<uint8_t> &buffer) {
    assert(buffer.size() > HEADER_SIZE);

    size_t offset = HEADER_SIZE;
    std::string qname;
    while (buffer[offset] != 0) {
        size_t length = buffer[offset];
        assert(length <= MAX_LABEL_LENGTH && offset + 1 + length < buffer.size());
        qname.append(buffer.begin() + offset + 1, buffer.begin() + offset + 1 + length);
        qname.push_back('.');
        offset += 1 + length;
    }
    if (qname.empty()) qname = ".";
    offset++;

    auto qtype = static_cast<RRType>(u16_at(buffer, offset));
    offset += 4;
    assert(offset <= buffer.size());

    return MockRequest{
        .id = u16_at(buffer, 0),
        .question_count = u16_at(buffer, 4),
        .question = MockQuestion{.qname = std::move(qname), .qtype = qtype},
        .question_wire = {buffer.begin() + HEADER_SIZE, buffer.begin() + offset},
        .opt = {buffer.begin() + offset, buffer.end()},
    };
}

// Echoes the request's OPT, a server cookie is added the first time only a client cookie arrives.
std::vector<uint8_t> response_opt(const MockResponse &mock, std::vector<uint8_t> opt) {
    opt[OPT_EXTENDED_RCODE] = static_cast<uint8_t>(std::to_underlying(mock.rcode) >> 4);

    auto has_cookies = opt.size() >= OPT_CLIENT_COOKIE + CLIENT_COOKIE_SIZE
                       && u16_at(opt, OPT_OPTION_CODE) == std::to_underlying(OptionCode::Cookies);
    if (!has_cookies) return opt;

    if (mock.set_wrong_client_cookie) opt[OPT_CLIENT_COOKIE]++;

    auto has_server_cookie = u16_at(opt, OPT_OPTION_LENGTH) > CLIENT_COOKIE_SIZE;
    if (mock.add_server_cookie && !has_server_cookie) {
        opt.insert(opt.end(), std::begin(SERVER_COOKIE), std::end(SERVER_COOKIE));
        set_u16_at(opt, OPT_DATA_LENGTH, u16_at(opt, OPT_DATA_LENGTH) + sizeof(SERVER_COOKIE));
        set_u16_at(opt, OPT_OPTION_LENGTH, CLIENT_COOKIE_SIZE + sizeof(SERVER_COOKIE));
    }
    return opt;
}

std::vector<uint8_t> build_response(const MockResponse &mock, const MockRequest &request) {
    auto echo_opt = mock.copy_opt && !request.opt.empty();

    auto flags = static_cast<uint16_t>((std::to_underlying(mock.opcode) << 11)
                                       | (std::to_underlying(mock.rcode) & 0b1111));
    if (mock.is_response) flags |= 1 << 15;
    if (mock.is_authoritative) flags |= 1 << 10;
    if (mock.is_truncated) flags |= 1 << 9;

    std::vector<uint8_t> response;
    write_u16(response, static_cast<uint16_t>(mock.set_wrong_id ? request.id + 1 : request.id));
    write_u16(response, flags);
    write_u16(response, mock.questions_count > 0 ? mock.questions_count : request.question_count);
    write_u16(response, mock.answers_count);
    write_u16(response, mock.authority_count);
    write_u16(response, static_cast<uint16_t>(mock.additional_count + (echo_opt ? 1 : 0)));

    const auto &question = mock.questions_count > 0 ? mock.questions : request.question_wire;
    for (const auto *section : {&question, &mock.answers, &mock.authority}) {
        response.insert(response.end(), section->begin(), section->end());
    }
    // OPT goes first in the additional section, the way it was in the request.
    if (echo_opt) {
        auto opt = response_opt(mock, request.opt);
        response.insert(response.end(), opt.begin(), opt.end());
    }
    response.insert(response.end(), mock.additional.begin(), mock.additional.end());
    return response;
}
}  // namespace

extern "C" {
ssize_t recvfrom(int _fd, void *buf, size_t n, int _flags, struct sockaddr *addr, socklen_t *addr_len) {
    (void) _fd;
    (void) _flags;

    assert(addr != nullptr && addr_len != nullptr && *addr_len >= sizeof(request_address));
    *reinterpret_cast<struct sockaddr_in *>(addr) = request_address;
    *addr_len = sizeof(request_address);

    auto request = parse_request(request_buffer);
    auto scripted = mock_zone.find(request.question);
    const auto &mock = scripted == mock_zone.end() ? mock_response : scripted->second;

    // Anything past the receive buffer is lost, like the tail of an oversized datagram.
    auto response = build_response(mock, request);
    auto size = std::min(n, response.size());
    std::memcpy(buf, response.data(), size);
    return static_cast<ssize_t>(size);
}
}
