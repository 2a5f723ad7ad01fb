#include "SrftRawSocket.h"

#include "srft_headers.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <iostream>
#include <stdexcept>
#include <utility>

SrftRawSocket::SrftRawSocket(std::string local_ip, uint16_t local_port)
    : local_ip_(std::move(local_ip)), local_port_(local_port), rbuf_(65536) {}

SrftRawSocket::~SrftRawSocket() {
    close();
}

bool SrftRawSocket::open(int recv_timeout_ms) {
    fd = ::socket(AF_INET, SOCK_RAW, IPPROTO_UDP);
    if (fd < 0) {
        int err = errno;
        perror("socket(SOCK_RAW)");
        if (err == EPERM || err == EACCES) {
            std::cerr << "Raw sockets require root privileges (CAP_NET_RAW). Run with sudo.\n";
        }
        return false;
    }

    int on = 1;
    if (setsockopt(fd, IPPROTO_IP, IP_HDRINCL, &on, sizeof(on)) < 0) {
        perror("setsockopt IP_HDRINCL");
        return false;
    }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_port = htons(local_port_);
    if (inet_pton(AF_INET, local_ip_.c_str(), &local.sin_addr) != 1) {
        std::cerr << "Invalid local IP: " << local_ip_ << "\n";
        return false;
    }
    if (bind(fd, (sockaddr*)&local, sizeof(local)) < 0) {
        perror("bind");
        return false;
    }

    timeval tv{};
    tv.tv_sec = recv_timeout_ms / 1000;
    tv.tv_usec = (recv_timeout_ms % 1000) * 1000;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        perror("setsockopt SO_RCVTIMEO");
        return false;
    }
    return true;
}

void SrftRawSocket::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool SrftRawSocket::send_packet(const SrftPacket& p, const std::string& dst_ip, uint16_t dst_port) {
    std::vector<uint8_t> bytes;
    try {
        bytes = srft_frame_datagram(local_ip_, local_port_, dst_ip, dst_port, p.to_bytes());
    } catch (const std::exception& e) {
        std::cerr << "Cannot frame packet " << p.describe() << ": " << e.what() << "\n";
        return false;
    }

    sockaddr_in to{};
    to.sin_family = AF_INET;
    to.sin_port = htons(dst_port);
    if (inet_pton(AF_INET, dst_ip.c_str(), &to.sin_addr) != 1) {
        std::cerr << "Invalid destination IP: " << dst_ip << "\n";
        return false;
    }

    ssize_t n = sendto(fd, bytes.data(), bytes.size(), 0, (sockaddr*)&to, sizeof(to));
    if (n < 0) { perror("sendto"); return false; }
    if ((size_t)n != bytes.size()) {
        std::cerr << "Partial send!? sent=" << n << " expected=" << bytes.size() << "\n";
        return false;
    }
    return true;
}

std::optional<SrftDatagram> SrftRawSocket::recv_packet() {
    sockaddr_in from{};
    socklen_t alen = sizeof(from);

    ssize_t n = recvfrom(fd, rbuf_.data(), rbuf_.size(), 0, (sockaddr*)&from, &alen);
    if (n < 0) {
        if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) return std::nullopt;
        perror("recvfrom");
        return std::nullopt;
    }

    auto view = srft_unframe_datagram(rbuf_.data(), (size_t)n);
    if (!view) return std::nullopt;
    if (view->udp.dst_port != local_port_) return std::nullopt;

    SrftDatagram d;
    try {
        d.packet = SrftPacket::from_bytes(view->app, view->app_len);
    } catch (const SrftChecksumError& e) {
        corrupted_++;
        std::cerr << "Corrupted packet from " << view->ip.src_ip << ": " << e.what() << "\n";
        return std::nullopt;
    }
    d.src_ip = view->ip.src_ip;
    d.src_port = view->udp.src_port;
    return d;
}
