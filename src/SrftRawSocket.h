#pragma once

#include "srft_protocol.h"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct SrftDatagram {
    SrftPacket packet;
    std::string src_ip;
    uint16_t src_port = 0;
};

// IPv4 raw socket with IP_HDRINCL. Every packet is framed by hand with our
// own IP and UDP headers. Opening requires CAP_NET_RAW (usually root).
class SrftRawSocket {
public:
    SrftRawSocket(std::string local_ip, uint16_t local_port);
    ~SrftRawSocket();

    SrftRawSocket(const SrftRawSocket&) = delete;
    SrftRawSocket& operator=(const SrftRawSocket&) = delete;

    bool open(int recv_timeout_ms);
    void close();

    // One sendto per datagram; safe to call from several threads.
    bool send_packet(const SrftPacket& p, const std::string& dst_ip, uint16_t dst_port);

    // Next application packet addressed to local_port. No value on receive
    // timeout, foreign traffic or a corrupt packet. One reader at a time.
    std::optional<SrftDatagram> recv_packet();

    uint64_t corrupted() const { return corrupted_.load(); }
    const std::string& local_ip() const { return local_ip_; }
    uint16_t local_port() const { return local_port_; }

private:
    std::string local_ip_;
    uint16_t local_port_;
    int fd = -1;
    std::vector<uint8_t> rbuf_;
    std::atomic<uint64_t> corrupted_{0};
};
