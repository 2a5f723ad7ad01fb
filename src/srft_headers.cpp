#include "srft_headers.h"

#include "srft_protocol.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace {

in_addr to_in_addr(const std::string& ip) {
    in_addr a{};
    if (inet_pton(AF_INET, ip.c_str(), &a) != 1) {
        throw std::invalid_argument("invalid IPv4 address: " + ip);
    }
    return a;
}

std::string to_dotted(const uint8_t* p) {
    in_addr a{};
    std::memcpy(&a, p, 4);
    char buf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &a, buf, sizeof(buf));
    return buf;
}

std::vector<uint8_t> pack_ip(uint16_t total_length, uint16_t checksum, const in_addr& src,
                             const in_addr& dst) {
    std::vector<uint8_t> h(SRFT_IP_HEADER_SIZE);
    h[0] = 0x45;                          // version 4, 5 words
    h[1] = 0;                             // TOS
    srft_put16(&h[2], total_length);
    srft_put16(&h[4], 0);                 // identification
    srft_put16(&h[6], 0x4000);            // DF, no fragment offset
    h[8] = 64;                            // TTL
    h[9] = SRFT_IPPROTO_UDP;
    srft_put16(&h[10], checksum);
    std::memcpy(&h[12], &src, 4);         // already network order
    std::memcpy(&h[16], &dst, 4);
    return h;
}

} // namespace

std::vector<uint8_t> build_ip_header(const std::string& src_ip, const std::string& dst_ip,
                                     size_t payload_length) {
    if (payload_length > 0xFFFFu - SRFT_IP_HEADER_SIZE) {
        throw std::invalid_argument("IP payload too large: " + std::to_string(payload_length));
    }
    in_addr src = to_in_addr(src_ip);
    in_addr dst = to_in_addr(dst_ip);
    auto total = static_cast<uint16_t>(SRFT_IP_HEADER_SIZE + payload_length);

    uint16_t checksum = srft_checksum16(pack_ip(total, 0, src, dst));
    return pack_ip(total, checksum, src, dst);
}

std::optional<IpHeaderFields> parse_ip_header(const uint8_t* data, size_t len) {
    if (len < SRFT_IP_HEADER_SIZE) return std::nullopt;

    IpHeaderFields f;
    f.version = data[0] >> 4;
    f.header_length = static_cast<uint8_t>((data[0] & 0x0F) * 4);
    f.tos = data[1];
    f.total_length = srft_get16(data + 2);
    f.identification = srft_get16(data + 4);
    f.flags_fragment = srft_get16(data + 6);
    f.ttl = data[8];
    f.protocol = data[9];
    f.checksum = srft_get16(data + 10);
    f.src_ip = to_dotted(data + 12);
    f.dst_ip = to_dotted(data + 16);
    return f;
}

std::vector<uint8_t> build_udp_header(uint16_t src_port, uint16_t dst_port, size_t payload_length) {
    if (payload_length > 0xFFFFu - SRFT_UDP_HEADER_SIZE) {
        throw std::invalid_argument("UDP payload too large: " + std::to_string(payload_length));
    }
    std::vector<uint8_t> h(SRFT_UDP_HEADER_SIZE);
    srft_put16(&h[0], src_port);
    srft_put16(&h[2], dst_port);
    srft_put16(&h[4], static_cast<uint16_t>(SRFT_UDP_HEADER_SIZE + payload_length));
    srft_put16(&h[6], 0);
    return h;
}

std::optional<UdpHeaderFields> parse_udp_header(const uint8_t* data, size_t len) {
    if (len < SRFT_UDP_HEADER_SIZE) return std::nullopt;

    UdpHeaderFields f;
    f.src_port = srft_get16(data);
    f.dst_port = srft_get16(data + 2);
    f.length = srft_get16(data + 4);
    f.checksum = srft_get16(data + 6);
    return f;
}

std::vector<uint8_t> srft_frame_datagram(const std::string& src_ip, uint16_t src_port,
                                         const std::string& dst_ip, uint16_t dst_port,
                                         const std::vector<uint8_t>& app) {
    std::vector<uint8_t> udp = build_udp_header(src_port, dst_port, app.size());
    std::vector<uint8_t> out = build_ip_header(src_ip, dst_ip, udp.size() + app.size());
    out.insert(out.end(), udp.begin(), udp.end());
    out.insert(out.end(), app.begin(), app.end());
    return out;
}

std::optional<SrftDatagramView> srft_unframe_datagram(const uint8_t* data, size_t len) {
    auto ip = parse_ip_header(data, len);
    if (!ip) return std::nullopt;
    if (ip->version != 4 || ip->protocol != SRFT_IPPROTO_UDP) return std::nullopt;
    if (ip->header_length < SRFT_IP_HEADER_SIZE || ip->header_length > len) return std::nullopt;

    const uint8_t* udp_start = data + ip->header_length;
    size_t remaining = len - ip->header_length;
    auto udp = parse_udp_header(udp_start, remaining);
    if (!udp) return std::nullopt;

    size_t app_len = remaining - SRFT_UDP_HEADER_SIZE;
    if (udp->length >= SRFT_UDP_HEADER_SIZE) {
        app_len = std::min(app_len, static_cast<size_t>(udp->length - SRFT_UDP_HEADER_SIZE));
    }

    SrftDatagramView v;
    v.ip = std::move(*ip);
    v.udp = *udp;
    v.app = udp_start + SRFT_UDP_HEADER_SIZE;
    v.app_len = app_len;
    return v;
}
