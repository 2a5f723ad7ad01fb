#pragma once

#include <cstddef>
#include <cstdint>

// Protocol constants shared by client and server. Passed by value into every
// component; main() may override fields from the command line.
struct SrftConfig {
    uint16_t server_port = 12345;        // server listens here
    uint16_t client_port = 12346;        // client receives here
    size_t max_payload_size = 1024;      // bytes per DATA packet
    uint32_t window_size = 4;            // max in-flight packets
    int timeout_ms = 500;                // retransmission timeout
    int max_retries = 10;                // retransmissions per packet
    int timer_poll_ms = 50;              // timeout checker interval
    int recv_timeout_ms = 200;           // socket SO_RCVTIMEO
    int completion_timeout_ms = 60000;   // server waits this long for final ACKs
};
