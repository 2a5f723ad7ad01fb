#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

constexpr size_t SRFT_IP_HEADER_SIZE = 20;   // IPv4 without options
constexpr size_t SRFT_UDP_HEADER_SIZE = 8;
constexpr uint8_t SRFT_IPPROTO_UDP = 17;

struct IpHeaderFields {
    uint8_t version = 0;
    uint8_t header_length = 0;   // bytes (IHL * 4)
    uint8_t tos = 0;
    uint16_t total_length = 0;
    uint16_t identification = 0;
    uint16_t flags_fragment = 0;
    uint8_t ttl = 0;
    uint8_t protocol = 0;
    uint16_t checksum = 0;
    std::string src_ip;          // dotted decimal
    std::string dst_ip;
};

struct UdpHeaderFields {
    uint16_t src_port = 0;
    uint16_t dst_port = 0;
    uint16_t length = 0;
    uint16_t checksum = 0;
};

// 20-byte IPv4 header: DF set, TTL 64, protocol UDP, header checksum filled in.
// payload_length covers everything after the IP header.
// Throws std::invalid_argument on a malformed address or oversized datagram.
std::vector<uint8_t> build_ip_header(const std::string& src_ip, const std::string& dst_ip,
                                     size_t payload_length);

// Decodes the fixed part of an IPv4 header. The checksum is not verified.
// Callers must use header_length to find the next layer.
std::optional<IpHeaderFields> parse_ip_header(const uint8_t* data, size_t len);

// 8-byte UDP header. The checksum is left at zero (optional over IPv4).
std::vector<uint8_t> build_udp_header(uint16_t src_port, uint16_t dst_port, size_t payload_length);

std::optional<UdpHeaderFields> parse_udp_header(const uint8_t* data, size_t len);

// IP + UDP + application bytes, ready for an IP_HDRINCL raw socket.
std::vector<uint8_t> srft_frame_datagram(const std::string& src_ip, uint16_t src_port,
                                         const std::string& dst_ip, uint16_t dst_port,
                                         const std::vector<uint8_t>& app);

struct SrftDatagramView {
    IpHeaderFields ip;
    UdpHeaderFields udp;
    const uint8_t* app = nullptr;   // points into the caller's buffer
    size_t app_len = 0;
};

// Strips IP and UDP headers from a raw read. Only UDP datagrams are accepted.
// The application bytes are bounded by the UDP length field so trailing
// padding from the read is dropped.
std::optional<SrftDatagramView> srft_unframe_datagram(const uint8_t* data, size_t len);
