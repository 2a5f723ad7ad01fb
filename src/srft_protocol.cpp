#include "srft_protocol.h"

#include <algorithm>
#include <sstream>

uint16_t srft_checksum16(const void* data, size_t len) {
    uint32_t sum = 0;
    const uint8_t* p = static_cast<const uint8_t*>(data);

    while (len > 1) {
        sum += (static_cast<uint32_t>(p[0]) << 8) | p[1];
        p += 2;
        len -= 2;
        if (sum > 0xFFFFu) sum = (sum & 0xFFFFu) + (sum >> 16);
    }
    if (len == 1) {
        sum += static_cast<uint32_t>(p[0]) << 8;
    }
    while (sum >> 16) {
        sum = (sum & 0xFFFFu) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum & 0xFFFFu);
}

uint16_t srft_checksum16(const std::vector<uint8_t>& data) {
    return srft_checksum16(data.data(), data.size());
}

bool srft_verify_checksum(const void* data, size_t len) {
    return srft_checksum16(data, len) == 0;
}

bool srft_verify_checksum(const std::vector<uint8_t>& data) {
    return srft_verify_checksum(data.data(), data.size());
}

void srft_put16(uint8_t* out, uint16_t v) {
    out[0] = static_cast<uint8_t>(v >> 8);
    out[1] = static_cast<uint8_t>(v);
}

void srft_put32(uint8_t* out, uint32_t v) {
    out[0] = static_cast<uint8_t>(v >> 24);
    out[1] = static_cast<uint8_t>(v >> 16);
    out[2] = static_cast<uint8_t>(v >> 8);
    out[3] = static_cast<uint8_t>(v);
}

uint16_t srft_get16(const uint8_t* in) {
    return static_cast<uint16_t>((in[0] << 8) | in[1]);
}

uint32_t srft_get32(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) | in[3];
}

namespace {

std::vector<uint8_t> pack_packet(uint32_t seq, uint32_t ack, uint16_t flags, uint16_t checksum,
                                 const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out(SRFT_HEADER_SIZE + payload.size());
    srft_put32(out.data(), seq);
    srft_put32(out.data() + 4, ack);
    srft_put16(out.data() + 8, flags);
    srft_put16(out.data() + 10, checksum);
    srft_put16(out.data() + 12, static_cast<uint16_t>(payload.size()));
    std::copy(payload.begin(), payload.end(), out.begin() + SRFT_HEADER_SIZE);
    return out;
}

} // namespace

std::vector<uint8_t> srft_encode_packet(uint32_t seq_num, uint32_t ack_num, uint16_t flags,
                                        const std::vector<uint8_t>& payload) {
    if (payload.size() > 0xFFFFu) {
        throw std::length_error("srft_encode_packet: payload exceeds 65535 bytes");
    }
    // Checksum over the header with a zero placeholder, then rebuild.
    uint16_t checksum = srft_checksum16(pack_packet(seq_num, ack_num, flags, 0, payload));
    return pack_packet(seq_num, ack_num, flags, checksum, payload);
}

std::vector<uint8_t> SrftPacket::to_bytes() const {
    return srft_encode_packet(seq_num, ack_num, flags, payload);
}

SrftPacket SrftPacket::from_bytes(const uint8_t* data, size_t len) {
    if (!srft_verify_checksum(data, len)) {
        throw SrftChecksumError("checksum verification failed, packet is corrupted");
    }
    if (len < SRFT_HEADER_SIZE) {
        throw SrftChecksumError("truncated packet: " + std::to_string(len) + " bytes");
    }
    uint16_t payload_len = srft_get16(data + 12);
    if (SRFT_HEADER_SIZE + payload_len > len) {
        throw SrftChecksumError("truncated payload: header claims " + std::to_string(payload_len) +
                                " bytes, " + std::to_string(len - SRFT_HEADER_SIZE) + " present");
    }

    SrftPacket p;
    p.seq_num = srft_get32(data);
    p.ack_num = srft_get32(data + 4);
    p.flags = srft_get16(data + 8);
    p.payload.assign(data + SRFT_HEADER_SIZE, data + SRFT_HEADER_SIZE + payload_len);
    return p;
}

SrftPacket SrftPacket::from_bytes(const std::vector<uint8_t>& data) {
    return from_bytes(data.data(), data.size());
}

std::string SrftPacket::describe() const {
    std::string names;
    auto add = [&](bool on, const char* name) {
        if (!on) return;
        if (!names.empty()) names += "|";
        names += name;
    };
    add(is_data(), "DATA");
    add(is_ack(), "ACK");
    add(is_fin(), "FIN");
    add(is_request(), "REQ");
    if (names.empty()) names = "NONE";

    std::ostringstream oss;
    oss << "seq=" << seq_num << " ack=" << ack_num << " flags=" << names
        << " len=" << payload.size();
    return oss.str();
}
