#pragma once

#include "SrftRawSocket.h"
#include "SrftWindowSender.h"
#include "srft_config.h"
#include "srft_stats.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct SrftServerArgs {
    std::string server_ip;                       // local address to bind
    std::string files_dir = "./test_files";      // where requested files live
    std::optional<std::string> report_path;      // optional statistics file
    bool verbose = false;                        // per-packet traces
    SrftConfig cfg;
};

// Serves one file per run: waits for a REQUEST, streams the named file
// through the sliding-window sender, then writes the statistics report.
class SrftServer {
public:
    explicit SrftServer(const SrftServerArgs& args);
    ~SrftServer();

    SrftServer(const SrftServer&) = delete;
    SrftServer& operator=(const SrftServer&) = delete;

    bool init();
    bool run();

    const SrftTransferStats& stats() const { return stats_; }

private:
    bool send_file(const std::string& filename);
    void ack_listener();
    bool xmit(const SrftPacket& p);

private:
    SrftServerArgs A;
    SrftRawSocket sock;
    std::string client_ip;
    uint16_t client_port = 0;

    std::unique_ptr<SrftWindowSender> sender;
    std::atomic<bool> listening{false};
    SrftTransferStats stats_;
};

// Resolves a requested name inside dir. Names with path separators or dot
// components are rejected.
std::optional<std::string> srft_resolve_request(const std::string& dir, const std::string& name);
