#pragma once

#include "srft_config.h"
#include "srft_protocol.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

struct SrftSenderStats {
    uint64_t packets_sent = 0;
    uint64_t retransmissions = 0;
};

// Sliding-window sender for one transfer. Sequence numbers start at 0 and
// grow by one per packet; ACKs are cumulative. A background thread resends
// packets that stay unacknowledged longer than cfg.timeout_ms.
//
// The transmit function is invoked with the window lock held, from both the
// caller of send() and the timer thread. It must not call back into the
// sender and must tolerate concurrent use.
class SrftWindowSender {
public:
    using Clock = std::chrono::steady_clock;
    using TransmitFunction = std::function<bool(const SrftPacket&)>;

    SrftWindowSender(const SrftConfig& cfg, TransmitFunction transmit);
    ~SrftWindowSender();

    SrftWindowSender(const SrftWindowSender&) = delete;
    SrftWindowSender& operator=(const SrftWindowSender&) = delete;

    // Blocks while the window is full. Returns the sequence number used.
    uint32_t send(std::vector<uint8_t> payload, uint16_t flags = FLG_DATA);

    void handle_ack(uint32_t ack_num);

    bool all_acked() const;
    bool wait_for_completion(std::chrono::milliseconds timeout);

    // Stops the timer thread. Packets still in flight are not recalled.
    void stop();

    SrftSenderStats stats() const;
    uint32_t base() const;
    uint32_t next_seq_num() const;
    size_t in_flight() const;

private:
    struct Unacked {
        SrftPacket packet;
        Clock::time_point last_sent;
        int retry_count = 0;
        bool exhausted_reported = false;
    };

    // Everything below is guarded by m_.
    struct WindowState {
        uint32_t base = 0;
        uint32_t next_seq_num = 0;
        std::map<uint32_t, Unacked> in_flight;
        SrftSenderStats stats;
        bool running = true;
    };

    void timeout_loop();
    void scan_timeouts(Clock::time_point now);

    const SrftConfig cfg_;
    TransmitFunction transmit_;

    mutable std::mutex m_;
    std::condition_variable progress_cv_;   // ACK advanced the window or sender stopped
    std::condition_variable stop_cv_;
    WindowState st_;
    std::thread timer_;
};
