#include "srft_stats.h"

#include <fstream>
#include <iomanip>
#include <iostream>

double SrftTransferStats::duration_s() const {
    if (end_time <= start_time) return 0.0;
    return std::chrono::duration<double>(end_time - start_time).count();
}

double SrftTransferStats::throughput_kbps() const {
    double d = duration_s();
    if (d <= 0.0) return 0.0;
    return (file_size / 1024.0) / d;
}

void SrftTransferStats::write_report(std::ostream& os) const {
    os << "=== SRFT " << role << " report ===\n"
       << "  file:             " << file_name << "\n"
       << "  size:             " << file_size << " bytes\n"
       << "  status:           " << (completed ? "complete" : "INCOMPLETE") << "\n"
       << "  packets sent:     " << packets_sent << "\n"
       << "  packets received: " << packets_received << "\n"
       << "  retransmissions:  " << retransmissions << "\n"
       << "  duplicates:       " << duplicates << "\n"
       << "  corrupted:        " << corrupted << "\n"
       << std::fixed << std::setprecision(3)
       << "  duration:         " << duration_s() << " s\n"
       << "  throughput:       " << throughput_kbps() << " KiB/s\n";
}

bool SrftTransferStats::write_report(const std::string& path) const {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        std::cerr << "Failed to open report file: " << path << "\n";
        return false;
    }
    write_report(ofs);
    return static_cast<bool>(ofs);
}
