#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

struct SrftTransferStats {
    std::string role;              // "server" or "client"
    std::string file_name;
    uint64_t file_size = 0;        // bytes read (server) or written (client)
    uint64_t packets_sent = 0;
    uint64_t packets_received = 0;
    uint64_t retransmissions = 0;
    uint64_t duplicates = 0;
    uint64_t corrupted = 0;
    bool completed = false;

    std::chrono::steady_clock::time_point start_time{};
    std::chrono::steady_clock::time_point end_time{};

    double duration_s() const;
    double throughput_kbps() const;   // file bytes over duration, KiB/s

    void write_report(std::ostream& os) const;
    bool write_report(const std::string& path) const;
};
