#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Application header (network order, 14 bytes):
//   seq_num:u32 ack_num:u32 flags:u16 checksum:u16 payload_length:u16
// followed by payload_length bytes of payload.
constexpr size_t SRFT_HEADER_SIZE = 14;

// Flags
enum : uint16_t {
    FLG_DATA    = 0x0001,
    FLG_ACK     = 0x0002,
    FLG_FIN     = 0x0004,
    FLG_REQUEST = 0x0008,
};

// Internet checksum (RFC 1071) over big-endian 16-bit words. An odd trailing
// byte is padded with zero for the computation only.
uint16_t srft_checksum16(const void* data, size_t len);
uint16_t srft_checksum16(const std::vector<uint8_t>& data);

// True when data, which already carries its checksum, sums to zero.
bool srft_verify_checksum(const void* data, size_t len);
bool srft_verify_checksum(const std::vector<uint8_t>& data);

// Big-endian field helpers used by every codec.
void srft_put16(uint8_t* out, uint16_t v);
void srft_put32(uint8_t* out, uint32_t v);
uint16_t srft_get16(const uint8_t* in);
uint32_t srft_get32(const uint8_t* in);

class SrftChecksumError : public std::runtime_error {
public:
    explicit SrftChecksumError(const std::string& what) : std::runtime_error(what) {}
};

struct SrftPacket {
    uint32_t seq_num = 0;
    uint32_t ack_num = 0;
    uint16_t flags = 0;
    std::vector<uint8_t> payload;

    SrftPacket() = default;
    SrftPacket(uint32_t seq, uint32_t ack, uint16_t flg, std::vector<uint8_t> data)
        : seq_num(seq), ack_num(ack), flags(flg), payload(std::move(data)) {}

    bool is_data() const { return (flags & FLG_DATA) != 0; }
    bool is_ack() const { return (flags & FLG_ACK) != 0; }
    bool is_fin() const { return (flags & FLG_FIN) != 0; }
    bool is_request() const { return (flags & FLG_REQUEST) != 0; }

    uint16_t payload_length() const { return static_cast<uint16_t>(payload.size()); }

    // Header with the real checksum followed by the payload.
    // Throws std::length_error if the payload does not fit a u16 length.
    std::vector<uint8_t> to_bytes() const;

    // Throws SrftChecksumError on corrupted or truncated input. Bytes past
    // payload_length are ignored.
    static SrftPacket from_bytes(const uint8_t* data, size_t len);
    static SrftPacket from_bytes(const std::vector<uint8_t>& data);

    std::string describe() const;
};

std::vector<uint8_t> srft_encode_packet(uint32_t seq_num, uint32_t ack_num, uint16_t flags,
                                        const std::vector<uint8_t>& payload);
