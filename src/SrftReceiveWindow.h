#pragma once

#include "srft_protocol.h"

#include <cstdint>
#include <optional>
#include <ostream>

// Go-back-N style receiver: delivers DATA strictly in sequence order to an
// output stream and produces cumulative ACK numbers. Out-of-order packets are
// dropped without an ACK; duplicates are re-ACKed so a lost ACK is repaired.
class SrftReceiveWindow {
public:
    explicit SrftReceiveWindow(std::ostream& out) : out_(out) {}

    // Returns the ACK number to send back, if any.
    std::optional<uint32_t> on_packet(const SrftPacket& p);

    bool finished() const { return finished_; }
    uint32_t expected_seq() const { return expected_; }

    uint64_t delivered() const { return delivered_; }
    uint64_t bytes_written() const { return bytes_written_; }
    uint64_t duplicates() const { return duplicates_; }
    uint64_t out_of_order() const { return out_of_order_; }

private:
    std::ostream& out_;
    uint32_t expected_ = 0;
    bool finished_ = false;

    uint64_t delivered_ = 0;
    uint64_t bytes_written_ = 0;
    uint64_t duplicates_ = 0;
    uint64_t out_of_order_ = 0;
};
