#include "SrftWindowSender.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

SrftWindowSender::SrftWindowSender(const SrftConfig& cfg, TransmitFunction transmit)
    : cfg_(cfg), transmit_(std::move(transmit)) {
    if (cfg_.window_size == 0) {
        throw std::invalid_argument("SrftWindowSender: window_size must be >= 1");
    }
    if (!transmit_) {
        throw std::invalid_argument("SrftWindowSender: transmit function is empty");
    }
    timer_ = std::thread([this] { timeout_loop(); });
}

SrftWindowSender::~SrftWindowSender() {
    stop();
}

uint32_t SrftWindowSender::send(std::vector<uint8_t> payload, uint16_t flags) {
    if (payload.size() > cfg_.max_payload_size) {
        throw std::invalid_argument("payload of " + std::to_string(payload.size()) +
                                    " bytes exceeds max_payload_size " +
                                    std::to_string(cfg_.max_payload_size));
    }

    std::unique_lock<std::mutex> lk(m_);
    progress_cv_.wait(lk, [this] {
        return !st_.running || st_.next_seq_num - st_.base < cfg_.window_size;
    });
    if (!st_.running) {
        throw std::logic_error("send on stopped SrftWindowSender");
    }

    uint32_t seq = st_.next_seq_num;
    SrftPacket pkt(seq, /*ack*/0, flags, std::move(payload));

    if (!transmit_(pkt)) {
        std::cerr << "transmit failed for seq=" << seq << ", left to the retransmission timer\n";
    }

    Unacked rec;
    rec.packet = std::move(pkt);
    rec.last_sent = Clock::now();
    st_.in_flight.emplace(seq, std::move(rec));
    st_.next_seq_num++;
    st_.stats.packets_sent++;
    return seq;
}

void SrftWindowSender::handle_ack(uint32_t ack_num) {
    {
        std::lock_guard<std::mutex> lk(m_);
        auto end = st_.in_flight.upper_bound(ack_num);
        st_.in_flight.erase(st_.in_flight.begin(), end);

        if (ack_num >= st_.base) {
            // An ACK beyond anything sent must not push base past next_seq_num.
            st_.base = ack_num < st_.next_seq_num ? ack_num + 1 : st_.next_seq_num;
        }
    }
    progress_cv_.notify_all();
}

bool SrftWindowSender::all_acked() const {
    std::lock_guard<std::mutex> lk(m_);
    return st_.in_flight.empty();
}

bool SrftWindowSender::wait_for_completion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_);
    return progress_cv_.wait_for(lk, timeout, [this] { return st_.in_flight.empty(); });
}

void SrftWindowSender::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        st_.running = false;
    }
    stop_cv_.notify_all();
    progress_cv_.notify_all();
    if (timer_.joinable() && timer_.get_id() != std::this_thread::get_id()) {
        timer_.join();
    }
}

SrftSenderStats SrftWindowSender::stats() const {
    std::lock_guard<std::mutex> lk(m_);
    return st_.stats;
}

uint32_t SrftWindowSender::base() const {
    std::lock_guard<std::mutex> lk(m_);
    return st_.base;
}

uint32_t SrftWindowSender::next_seq_num() const {
    std::lock_guard<std::mutex> lk(m_);
    return st_.next_seq_num;
}

size_t SrftWindowSender::in_flight() const {
    std::lock_guard<std::mutex> lk(m_);
    return st_.in_flight.size();
}

void SrftWindowSender::timeout_loop() {
    const auto poll = std::chrono::milliseconds(cfg_.timer_poll_ms);

    std::unique_lock<std::mutex> lk(m_);
    while (st_.running) {
        stop_cv_.wait_for(lk, poll, [this] { return !st_.running; });
        if (!st_.running) break;
        scan_timeouts(Clock::now());
    }
}

void SrftWindowSender::scan_timeouts(Clock::time_point now) {
    const auto timeout = std::chrono::milliseconds(cfg_.timeout_ms);

    for (auto& kv : st_.in_flight) {
        Unacked& rec = kv.second;
        if (now - rec.last_sent <= timeout) continue;

        if (rec.retry_count >= cfg_.max_retries) {
            // Known gap: the packet stays in flight and the transfer is not aborted.
            if (!rec.exhausted_reported) {
                std::cerr << "WARNING: max retries (" << cfg_.max_retries
                          << ") exceeded for seq=" << kv.first << "\n";
                rec.exhausted_reported = true;
            }
            continue;
        }

        if (!transmit_(rec.packet)) {
            std::cerr << "retransmit failed for seq=" << kv.first << "\n";
        }
        st_.stats.retransmissions++;
        rec.last_sent = now;
        rec.retry_count++;
    }
}
