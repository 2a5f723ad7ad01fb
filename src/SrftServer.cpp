#include "SrftServer.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using Clock = std::chrono::steady_clock;

std::optional<std::string> srft_resolve_request(const std::string& dir, const std::string& name) {
    if (name.empty() || name == "." || name == "..") return std::nullopt;
    if (name.find('/') != std::string::npos || name.find('\0') != std::string::npos) {
        return std::nullopt;
    }
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

SrftServer::SrftServer(const SrftServerArgs& args)
    : A(args), sock(args.server_ip, args.cfg.server_port) {}

SrftServer::~SrftServer() {
    if (sender) sender->stop();
}

bool SrftServer::init() {
    if (!sock.open(A.cfg.recv_timeout_ms)) return false;

    std::cerr << "Server listening on " << A.server_ip << ":" << A.cfg.server_port
              << ", serving " << A.files_dir
              << " (window=" << A.cfg.window_size << ", rto=" << A.cfg.timeout_ms
              << " ms, retries=" << A.cfg.max_retries << ")\n";
    return true;
}

bool SrftServer::run() {
    std::cerr << "Waiting for file request...\n";

    std::string filename;
    while (true) {
        auto d = sock.recv_packet();
        if (!d) continue;
        if (!d->packet.is_request()) {
            if (A.verbose) std::cerr << "Ignoring " << d->packet.describe() << " before REQUEST\n";
            continue;
        }
        client_ip = d->src_ip;
        client_port = A.cfg.client_port;
        filename.assign(d->packet.payload.begin(), d->packet.payload.end());
        std::cerr << "Received request for '" << filename << "' from " << client_ip << ":"
                  << d->src_port << "\n";
        break;
    }

    bool ok = send_file(filename);

    stats_.write_report(std::cout);
    if (A.report_path) stats_.write_report(*A.report_path);

    sock.close();
    std::cerr << "Server finished.\n";
    return ok;
}

bool SrftServer::send_file(const std::string& filename) {
    stats_.role = "server";
    stats_.file_name = filename;

    auto path = srft_resolve_request(A.files_dir, filename);
    if (!path) {
        std::cerr << "ERROR: Rejected file name: '" << filename << "'\n";
        return false;
    }
    std::ifstream f(*path, std::ios::binary);
    if (!f) {
        std::cerr << "ERROR: File not found: " << *path << "\n";
        return false;
    }

    sender = std::make_unique<SrftWindowSender>(A.cfg, [this](const SrftPacket& p) { return xmit(p); });

    listening = true;
    std::thread listener([this] { ack_listener(); });

    stats_.start_time = Clock::now();

    std::vector<uint8_t> buf(A.cfg.max_payload_size);
    bool read_ok = true;
    while (true) {
        f.read(reinterpret_cast<char*>(buf.data()), (std::streamsize)buf.size());
        std::streamsize got = f.gcount();
        if (got <= 0) break;

        std::vector<uint8_t> chunk(buf.begin(), buf.begin() + got);
        stats_.file_size += (uint64_t)got;
        sender->send(std::move(chunk), FLG_DATA);
    }
    if (f.bad()) {
        std::cerr << "ERROR: Read failed on " << *path << "\n";
        read_ok = false;
    }
    sender->send({}, FLG_FIN);

    std::cerr << "Sent " << stats_.file_size << " bytes, waiting for all ACKs...\n";
    stats_.completed = sender->wait_for_completion(std::chrono::milliseconds(A.cfg.completion_timeout_ms));
    if (stats_.completed) {
        std::cerr << "All packets acknowledged!\n";
    } else {
        std::cerr << "WARNING: Timed out waiting for ACKs (" << sender->in_flight()
                  << " packets in flight)\n";
    }
    stats_.end_time = Clock::now();

    sender->stop();
    listening = false;
    listener.join();

    SrftSenderStats ss = sender->stats();
    stats_.packets_sent = ss.packets_sent;
    stats_.retransmissions = ss.retransmissions;
    stats_.corrupted = sock.corrupted();
    return read_ok;
}

void SrftServer::ack_listener() {
    while (listening) {
        auto d = sock.recv_packet();
        if (!d) continue;
        if (d->src_ip != client_ip) continue;
        if (!d->packet.is_ack()) continue;

        if (A.verbose) std::cerr << "ACK " << d->packet.ack_num << "\n";
        sender->handle_ack(d->packet.ack_num);
        stats_.packets_received++;
    }
}

bool SrftServer::xmit(const SrftPacket& p) {
    if (A.verbose) std::cerr << "-> " << p.describe() << "\n";
    return sock.send_packet(p, client_ip, client_port);
}
