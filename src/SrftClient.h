#pragma once

#include "SrftRawSocket.h"
#include "srft_config.h"
#include "srft_stats.h"

#include <cstdint>
#include <string>

struct SrftClientArgs {
    std::string client_ip;                 // local address to bind
    std::string server_ip;
    std::string filename;                  // name requested from the server
    std::string out_path;                  // defaults to filename
    int linger_ms = 2000;                  // keep re-ACKing after FIN
    int idle_timeout_ms = 30000;           // give up when the server goes quiet
    bool verbose = false;
    SrftConfig cfg;
};

class SrftClient {
public:
    explicit SrftClient(const SrftClientArgs& args);
    ~SrftClient() = default;

    SrftClient(const SrftClient&) = delete;
    SrftClient& operator=(const SrftClient&) = delete;

    bool init();
    bool run();

    const SrftTransferStats& stats() const { return stats_; }

private:
    bool send_request();
    void send_ack(uint32_t ack_num);

private:
    SrftClientArgs A;
    SrftRawSocket sock;
    SrftTransferStats stats_;
};
