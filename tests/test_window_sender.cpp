#include "SrftReceiveWindow.h"
#include "SrftWindowSender.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

SrftConfig fast_config() {
    SrftConfig cfg;
    cfg.timeout_ms = 40;
    cfg.timer_poll_ms = 5;
    cfg.max_retries = 10;
    return cfg;
}

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// Records every transmission. Never calls back into the sender.
class Recorder {
public:
    bool operator()(const SrftPacket& p) {
        std::lock_guard<std::mutex> lk(m_);
        sent_.push_back(p);
        return true;
    }
    size_t count() const {
        std::lock_guard<std::mutex> lk(m_);
        return sent_.size();
    }
    size_t count_seq(uint32_t seq) const {
        std::lock_guard<std::mutex> lk(m_);
        size_t n = 0;
        for (auto& p : sent_) n += p.seq_num == seq;
        return n;
    }
    std::vector<SrftPacket> sent() const {
        std::lock_guard<std::mutex> lk(m_);
        return sent_;
    }

private:
    mutable std::mutex m_;
    std::vector<SrftPacket> sent_;
};

// Delivers packets to a receiver on its own thread and feeds ACKs back.
// The first transmission of every sequence number is dropped.
class LossyLink {
public:
    explicit LossyLink(std::ostream& out) : rw_(out) {}

    ~LossyLink() { shutdown(); }

    bool transmit(const SrftPacket& p) {
        std::lock_guard<std::mutex> lk(m_);
        if (attempts_[p.seq_num]++ == 0) return true;   // lost on the wire
        q_.push_back(p);
        cv_.notify_one();
        return true;
    }

    void start(SrftWindowSender& sender, size_t window) {
        worker_ = std::thread([this, &sender, window] {
            while (true) {
                SrftPacket p;
                {
                    std::unique_lock<std::mutex> lk(m_);
                    cv_.wait_for(lk, 5ms, [this] { return done_ || !q_.empty(); });
                    if (done_) return;
                    if (q_.empty()) continue;
                    p = q_.front();
                    q_.pop_front();
                }
                // The sender calls transmit() with its lock held, so never hold
                // m_ while calling into the sender.
                if (sender.in_flight() > window) window_violated_ = true;
                auto ack = rw_.on_packet(p);
                if (ack) sender.handle_ack(*ack);
            }
        });
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(m_);
            done_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) worker_.join();
    }

    bool window_violated() const { return window_violated_; }
    const SrftReceiveWindow& receiver() const { return rw_; }

private:
    SrftReceiveWindow rw_;
    std::mutex m_;
    std::condition_variable cv_;
    std::deque<SrftPacket> q_;
    std::map<uint32_t, int> attempts_;
    bool done_ = false;
    std::atomic<bool> window_violated_{false};
    std::thread worker_;
};

} // namespace

TEST(WindowSender, FillsWindowWithoutBlocking) {
    Recorder rec;
    SrftWindowSender s(fast_config(), std::ref(rec));

    for (uint32_t i = 0; i < 4; ++i) {
        EXPECT_EQ(s.send(bytes_of("chunk")), i);
    }
    EXPECT_EQ(rec.count(), 4u);
    EXPECT_EQ(s.in_flight(), 4u);
    EXPECT_EQ(s.base(), 0u);
    EXPECT_EQ(s.next_seq_num(), 4u);
    EXPECT_EQ(s.stats().packets_sent, 4u);

    auto sent = rec.sent();
    EXPECT_EQ(sent[2].seq_num, 2u);
    EXPECT_EQ(sent[2].ack_num, 0u);
    EXPECT_TRUE(sent[2].is_data());
    s.stop();
}

TEST(WindowSender, BlocksWhileWindowIsFull) {
    SrftConfig cfg = fast_config();
    cfg.timeout_ms = 10000;   // no retransmissions during this test
    Recorder rec;
    SrftWindowSender s(cfg, std::ref(rec));

    for (int i = 0; i < 4; ++i) s.send(bytes_of("x"));

    std::atomic<bool> fifth_sent{false};
    std::thread t([&] {
        s.send(bytes_of("y"));
        fifth_sent = true;
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(fifth_sent);
    EXPECT_EQ(rec.count(), 4u);

    s.handle_ack(0);
    t.join();
    EXPECT_TRUE(fifth_sent);
    EXPECT_EQ(rec.count(), 5u);
    EXPECT_EQ(s.in_flight(), 4u);
    EXPECT_EQ(s.base(), 1u);
    s.stop();
}

TEST(WindowSender, CumulativeAckRemovesEverythingCovered) {
    SrftConfig cfg = fast_config();
    cfg.timeout_ms = 10000;
    Recorder rec;
    SrftWindowSender s(cfg, std::ref(rec));

    for (int i = 0; i < 4; ++i) s.send(bytes_of("x"));
    s.handle_ack(2);
    EXPECT_EQ(s.in_flight(), 1u);
    EXPECT_EQ(s.base(), 3u);
    EXPECT_FALSE(s.all_acked());

    s.handle_ack(3);
    EXPECT_TRUE(s.all_acked());
    EXPECT_TRUE(s.wait_for_completion(10ms));
    s.stop();
}

TEST(WindowSender, BaseNeverMovesBackwards) {
    SrftConfig cfg = fast_config();
    cfg.timeout_ms = 10000;
    Recorder rec;
    SrftWindowSender s(cfg, std::ref(rec));

    for (int i = 0; i < 4; ++i) s.send(bytes_of("x"));

    uint32_t last = s.base();
    for (uint32_t ack : {1u, 0u, 1u, 2u, 0u, 2u}) {
        s.handle_ack(ack);
        EXPECT_GE(s.base(), last);
        last = s.base();
    }
    EXPECT_EQ(s.base(), 3u);
    EXPECT_EQ(s.in_flight(), 1u);
    s.stop();
}

TEST(WindowSender, AckBeyondSentIsClamped) {
    SrftConfig cfg = fast_config();
    cfg.timeout_ms = 10000;
    Recorder rec;
    SrftWindowSender s(cfg, std::ref(rec));

    s.send(bytes_of("a"));
    s.send(bytes_of("b"));
    s.handle_ack(50);
    EXPECT_TRUE(s.all_acked());
    EXPECT_EQ(s.base(), 2u);
    EXPECT_EQ(s.next_seq_num(), 2u);

    // Window is usable again and sequence numbers keep counting.
    EXPECT_EQ(s.send(bytes_of("c")), 2u);
    s.stop();
}

TEST(WindowSender, RetransmitsAfterTimeout) {
    Recorder rec;
    SrftWindowSender s(fast_config(), std::ref(rec));

    s.send(bytes_of("lost"));
    std::this_thread::sleep_for(150ms);
    EXPECT_GE(rec.count_seq(0), 2u);
    EXPECT_GE(s.stats().retransmissions, 1u);

    s.handle_ack(0);
    size_t after_ack = rec.count_seq(0);
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(rec.count_seq(0), after_ack);
    s.stop();
}

TEST(WindowSender, ExhaustedRecordStaysInFlight) {
    SrftConfig cfg = fast_config();
    cfg.timeout_ms = 10;
    cfg.max_retries = 2;
    Recorder rec;
    SrftWindowSender s(cfg, std::ref(rec));

    s.send(bytes_of("never acked"));
    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(s.stats().retransmissions, 2u);
    EXPECT_EQ(rec.count_seq(0), 3u);
    EXPECT_EQ(s.in_flight(), 1u);
    EXPECT_FALSE(s.wait_for_completion(30ms));
    s.stop();
}

TEST(WindowSender, RejectsOversizedPayload) {
    Recorder rec;
    SrftWindowSender s(fast_config(), std::ref(rec));
    EXPECT_THROW(s.send(std::vector<uint8_t>(1025)), std::invalid_argument);
    EXPECT_EQ(rec.count(), 0u);
    s.stop();
}

TEST(WindowSender, SendAfterStopThrows) {
    Recorder rec;
    SrftWindowSender s(fast_config(), std::ref(rec));
    s.stop();
    s.stop();
    EXPECT_THROW(s.send(bytes_of("x")), std::logic_error);
}

TEST(WindowSender, StopHaltsRetransmissions) {
    Recorder rec;
    SrftWindowSender s(fast_config(), std::ref(rec));
    s.send(bytes_of("x"));
    s.stop();
    size_t n = rec.count();
    std::this_thread::sleep_for(120ms);
    EXPECT_EQ(rec.count(), n);
}

TEST(WindowSender, DeliversFileOverLossyLink) {
    SrftConfig cfg = fast_config();
    std::ostringstream out;
    LossyLink link(out);
    SrftWindowSender s(cfg, [&link](const SrftPacket& p) { return link.transmit(p); });
    link.start(s, cfg.window_size);

    std::string file;
    for (int i = 0; i < 20; ++i) file += "chunk-" + std::to_string(i) + ";";

    for (size_t off = 0; off < file.size(); off += 16) {
        s.send(bytes_of(file.substr(off, 16)));
    }
    s.send({}, FLG_FIN);

    const auto bound = std::chrono::milliseconds(cfg.max_retries * cfg.timeout_ms * 10);
    EXPECT_TRUE(s.wait_for_completion(bound));
    s.stop();
    link.shutdown();

    EXPECT_EQ(out.str(), file);
    EXPECT_TRUE(link.receiver().finished());
    EXPECT_FALSE(link.window_violated());
    EXPECT_GE(s.stats().retransmissions, s.stats().packets_sent);
}
