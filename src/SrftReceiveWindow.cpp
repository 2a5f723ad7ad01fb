#include "SrftReceiveWindow.h"

std::optional<uint32_t> SrftReceiveWindow::on_packet(const SrftPacket& p) {
    if (!p.is_data() && !p.is_fin()) return std::nullopt;

    if (p.seq_num == expected_) {
        if (finished_) {
            // Nothing follows FIN within a transfer.
            out_of_order_++;
            return std::nullopt;
        }
        if (p.is_data() && !p.payload.empty()) {
            out_.write(reinterpret_cast<const char*>(p.payload.data()),
                       static_cast<std::streamsize>(p.payload.size()));
            bytes_written_ += p.payload.size();
        }
        if (p.is_fin()) finished_ = true;
        delivered_++;
        return expected_++;
    }

    if (p.seq_num < expected_) {
        duplicates_++;
        return expected_ - 1;
    }

    out_of_order_++;
    return std::nullopt;
}
