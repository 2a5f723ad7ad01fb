#include "SrftClient.h"

#include "SrftReceiveWindow.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using Clock = std::chrono::steady_clock;

SrftClient::SrftClient(const SrftClientArgs& args)
    : A(args), sock(args.client_ip, args.cfg.client_port) {
    if (A.out_path.empty()) A.out_path = A.filename;
}

bool SrftClient::init() {
    if (!sock.open(A.cfg.recv_timeout_ms)) return false;

    std::cerr << "Client on " << A.client_ip << ":" << A.cfg.client_port
              << ", requesting '" << A.filename << "' from " << A.server_ip << ":"
              << A.cfg.server_port << " -> " << A.out_path << "\n";
    return true;
}

bool SrftClient::run() {
    std::ofstream ofs(A.out_path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        std::cerr << "Failed to open output file: " << A.out_path << "\n";
        return false;
    }

    stats_.role = "client";
    stats_.file_name = A.filename;
    stats_.start_time = Clock::now();

    SrftReceiveWindow rw(ofs);

    // REQUEST is re-sent until the server answers with anything.
    const auto rto = std::chrono::milliseconds(A.cfg.timeout_ms);
    int request_tries = 0;
    if (!send_request()) return false;
    request_tries++;
    auto last_request = Clock::now();
    bool answered = false;

    auto last_heard = Clock::now();
    std::optional<Clock::time_point> fin_at;

    while (true) {
        auto now = Clock::now();
        if (fin_at && now - *fin_at >= std::chrono::milliseconds(A.linger_ms)) break;
        if (now - last_heard >= std::chrono::milliseconds(A.idle_timeout_ms)) {
            std::cerr << "Server silent for " << A.idle_timeout_ms << " ms, giving up\n";
            break;
        }
        if (!answered && now - last_request >= rto) {
            if (request_tries > A.cfg.max_retries) {
                std::cerr << "No answer to REQUEST after " << request_tries << " tries\n";
                break;
            }
            std::cerr << "  no answer -> resend REQUEST\n";
            if (!send_request()) return false;
            request_tries++;
            last_request = now;
        }

        auto d = sock.recv_packet();
        if (!d) continue;
        if (d->src_ip != A.server_ip || d->src_port != A.cfg.server_port) continue;

        answered = true;
        last_heard = Clock::now();
        stats_.packets_received++;

        auto ack = rw.on_packet(d->packet);
        if (A.verbose) {
            std::cerr << "<- " << d->packet.describe()
                      << (ack ? " -> ACK " + std::to_string(*ack) : std::string(" -> dropped"))
                      << "\n";
        }
        if (ack) send_ack(*ack);

        if (rw.finished() && !fin_at) {
            std::cerr << "FIN received. Total " << rw.bytes_written() << " bytes, lingering "
                      << A.linger_ms << " ms for duplicate FINs\n";
            fin_at = Clock::now();
            stats_.end_time = *fin_at;
        }
    }

    ofs.flush();
    stats_.completed = rw.finished() && static_cast<bool>(ofs);
    if (!fin_at) stats_.end_time = Clock::now();
    stats_.file_size = rw.bytes_written();
    stats_.duplicates = rw.duplicates();
    stats_.corrupted = sock.corrupted();
    stats_.write_report(std::cout);
    return stats_.completed;
}

bool SrftClient::send_request() {
    std::vector<uint8_t> name(A.filename.begin(), A.filename.end());
    if (name.size() > A.cfg.max_payload_size) {
        std::cerr << "File name longer than " << A.cfg.max_payload_size << " bytes\n";
        return false;
    }
    SrftPacket req(/*seq*/0, /*ack*/0, FLG_REQUEST, std::move(name));
    stats_.packets_sent++;
    return sock.send_packet(req, A.server_ip, A.cfg.server_port);
}

void SrftClient::send_ack(uint32_t ack_num) {
    SrftPacket ack(/*seq*/0, ack_num, FLG_ACK, {});
    stats_.packets_sent++;
    if (!sock.send_packet(ack, A.server_ip, A.cfg.server_port)) {
        std::cerr << "Failed to send ACK " << ack_num << "\n";
    }
}
